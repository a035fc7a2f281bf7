#pragma once

#include <string>
#include <vector>
#include <ql/time/date.hpp>

#include "BondSpec.hpp"

namespace BYC {

    struct CommandLineOptions {
        BondInput input;
        QuantLib::Date referenceDate; // null: today
        std::string debugLogPath;     // empty: debug log stays off
        bool showHelp;
    };

    // Defaults are the example request {1000, 5, 950, 10, 2}.
    BondInput defaultBondInput();

    // Throws QuantLib::Error on unknown flags or unparsable values.
    CommandLineOptions parseCommandLine(const std::vector<std::string>& args);

    CommandLineOptions parseCommandLine(int argc, char** argv);

    QuantLib::Date parseReferenceDate(const std::string& token);

    std::string usage(const std::string& programName);
}
