#include "toplevelfixture.hpp"
#include <boost/test/unit_test.hpp>
#include <ql/errors.hpp>

#include "PeriodModel.hpp"

using namespace QuantLib;
using namespace BYC;

namespace {

BondInput makeInput(double years, CouponFrequency frequency) {
    BondInput input;
    input.faceValue = 1000.0;
    input.annualCouponRate = 5.0;
    input.marketPrice = 950.0;
    input.yearsToMaturity = years;
    input.couponFrequency = frequency;
    return input;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(BondYieldTestSuite, BYC::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(PeriodModelTest)

BOOST_AUTO_TEST_CASE(testFrequencyMapping) {

    BOOST_TEST_MESSAGE("Testing coupon frequency mapping...");

    BOOST_CHECK_EQUAL(mapFrequency(CouponFrequency::Annual), Annual);
    BOOST_CHECK_EQUAL(mapFrequency(CouponFrequency::SemiAnnual), Semiannual);

    BOOST_CHECK(couponFrequencyFromInteger(1) == CouponFrequency::Annual);
    BOOST_CHECK(couponFrequencyFromInteger(2) == CouponFrequency::SemiAnnual);
    BOOST_CHECK_THROW(couponFrequencyFromInteger(4), QuantLib::Error);
    BOOST_CHECK_THROW(couponFrequencyFromInteger(0), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testPeriodModel) {

    BOOST_TEST_MESSAGE("Testing derived period model...");

    PeriodModel semi = buildPeriodModel(makeInput(10.0, CouponFrequency::SemiAnnual));
    BOOST_CHECK_EQUAL(semi.periodsPerYear, 2);
    BOOST_CHECK_EQUAL(semi.monthsPerPeriod, 6);
    BOOST_CHECK_EQUAL(semi.totalPeriods, 20);
    BOOST_CHECK_CLOSE(semi.couponPerPeriod, 25.0, 1e-12);
    BOOST_CHECK_EQUAL(semi.faceValue, 1000.0);

    PeriodModel annual = buildPeriodModel(makeInput(5.0, CouponFrequency::Annual));
    BOOST_CHECK_EQUAL(annual.periodsPerYear, 1);
    BOOST_CHECK_EQUAL(annual.monthsPerPeriod, 12);
    BOOST_CHECK_EQUAL(annual.totalPeriods, 5);
    BOOST_CHECK_CLOSE(annual.couponPerPeriod, 50.0, 1e-12);
}

BOOST_AUTO_TEST_CASE(testFractionalMaturityRounding) {

    BOOST_TEST_MESSAGE("Testing period count rounding for fractional maturities...");

    BOOST_CHECK_EQUAL(buildPeriodModel(makeInput(2.3, CouponFrequency::Annual)).totalPeriods, 2);
    BOOST_CHECK_EQUAL(buildPeriodModel(makeInput(2.5, CouponFrequency::SemiAnnual)).totalPeriods, 5);
    BOOST_CHECK_EQUAL(buildPeriodModel(makeInput(2.25, CouponFrequency::SemiAnnual)).totalPeriods, 5);
    BOOST_CHECK_EQUAL(buildPeriodModel(makeInput(0.2, CouponFrequency::Annual)).totalPeriods, 0);
}

BOOST_AUTO_TEST_CASE(testPaymentDates) {

    BOOST_TEST_MESSAGE("Testing payment dates are month offsets from the reference date...");

    Date ref(15, January, 2026);
    std::vector<Date> dates = paymentDates(buildPeriodModel(makeInput(2.0, CouponFrequency::SemiAnnual)), ref);

    BOOST_REQUIRE_EQUAL(dates.size(), 4u);
    BOOST_CHECK_EQUAL(dates[0], Date(15, July, 2026));
    BOOST_CHECK_EQUAL(dates[1], Date(15, January, 2027));
    BOOST_CHECK_EQUAL(dates[2], Date(15, July, 2027));
    BOOST_CHECK_EQUAL(dates[3], Date(15, January, 2028));

    std::vector<Date> annual = paymentDates(buildPeriodModel(makeInput(3.0, CouponFrequency::Annual)), ref);
    BOOST_REQUIRE_EQUAL(annual.size(), 3u);
    BOOST_CHECK_EQUAL(annual[2], Date(15, January, 2029));
}

BOOST_AUTO_TEST_CASE(testMonthEndPaymentDates) {

    BOOST_TEST_MESSAGE("Testing month-end reference dates...");

    // Each date is offset from the reference date, so the 31st comes back after February.
    Date ref(31, August, 2026);
    std::vector<Date> dates = paymentDates(buildPeriodModel(makeInput(1.0, CouponFrequency::SemiAnnual)), ref);

    BOOST_REQUIRE_EQUAL(dates.size(), 2u);
    BOOST_CHECK_EQUAL(dates[0], Date(28, February, 2027));
    BOOST_CHECK_EQUAL(dates[1], Date(31, August, 2027));

    std::vector<Date> leap = paymentDates(buildPeriodModel(makeInput(1.0, CouponFrequency::Annual)),
                                          Date(29, February, 2028));
    BOOST_REQUIRE_EQUAL(leap.size(), 1u);
    BOOST_CHECK_EQUAL(leap[0], Date(28, February, 2029));
}

BOOST_AUTO_TEST_CASE(testNoPeriods) {

    BOOST_TEST_MESSAGE("Testing a model without periods has no payment dates...");

    PeriodModel model = buildPeriodModel(makeInput(0.2, CouponFrequency::Annual));
    BOOST_CHECK(paymentDates(model, Date(15, January, 2026)).empty());
    BOOST_CHECK_THROW(paymentSchedule(model, Date(15, January, 2026)), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
