#include "pch.h"
#include "ITHIM.Core/exception.h"
#include "ITHIM.Core/math_util.h"

#include <cmath>
#include <limits>

TEST(TestCore_MathHelper, RadixValue) {
    using namespace ithim::core;

    ASSERT_EQ(2, MathHelper::radix());
}

TEST(TestCore_MathHelper, MachinePrecision) {
    using namespace ithim::core;

    ASSERT_LT(0.0, MathHelper::machine_precision());
    ASSERT_LT(0.0, MathHelper::default_numerical_precision());
}

TEST(TestCore_MathHelper, EqualsDefaultPrecision) {
    using namespace ithim::core;
    double a = (0.3 * 3.0) + 0.1;
    double b = 1.0;
    ASSERT_TRUE(MathHelper::equal(a, b));
    ASSERT_TRUE(MathHelper::equal(1.0, 1.0 + std::numeric_limits<double>::epsilon()));
    ASSERT_FALSE(MathHelper::equal(1.0, 1.001));
}

TEST(TestCore_MathHelper, NormalQuantileKnownValues) {
    using namespace ithim::core;

    ASSERT_NEAR(0.0, MathHelper::normal_quantile(0.5), 1e-10);
    ASSERT_NEAR(1.959963984540054, MathHelper::normal_quantile(0.975), 1e-9);
    ASSERT_NEAR(-1.281551565544601, MathHelper::normal_quantile(0.1), 1e-9);
    ASSERT_NEAR(-3.090232306167813, MathHelper::normal_quantile(0.001), 1e-9);
}

TEST(TestCore_MathHelper, NormalQuantileOutsideDomainThrows) {
    using namespace ithim::core;

    ASSERT_THROW(MathHelper::normal_quantile(0.0), NumericDomainError);
    ASSERT_THROW(MathHelper::normal_quantile(1.0), NumericDomainError);
    ASSERT_THROW(MathHelper::normal_quantile(-0.5), NumericDomainError);
}

TEST(TestCore_MathHelper, LognormalQuantileMedian) {
    using namespace ithim::core;

    ASSERT_NEAR(std::exp(1.5), MathHelper::lognormal_quantile(0.5, 1.5, 0.8), 1e-9);
    ASSERT_LT(MathHelper::lognormal_quantile(0.1, 1.5, 0.8),
              MathHelper::lognormal_quantile(0.9, 1.5, 0.8));
}

TEST(TestCore_MathHelper, LognormalDensity) {
    using namespace ithim::core;

    ASSERT_EQ(0.0, MathHelper::lognormal_density(0.0, 0.0, 1.0));
    ASSERT_EQ(0.0, MathHelper::lognormal_density(-1.0, 0.0, 1.0));
    ASSERT_NEAR(0.398942280401433, MathHelper::lognormal_density(1.0, 0.0, 1.0), 1e-12);
}

TEST(TestCore_MathHelper, EmpiricalQuantileInterpolates) {
    using namespace ithim::core;

    auto sample = std::vector<double>{1.0, 2.0, 3.0, 4.0, 5.0};
    ASSERT_DOUBLE_EQ(1.0, MathHelper::empirical_quantile(sample, 0.0));
    ASSERT_DOUBLE_EQ(3.0, MathHelper::empirical_quantile(sample, 0.5));
    ASSERT_DOUBLE_EQ(5.0, MathHelper::empirical_quantile(sample, 1.0));
    ASSERT_DOUBLE_EQ(1.4, MathHelper::empirical_quantile(sample, 0.1));
    ASSERT_DOUBLE_EQ(4.6, MathHelper::empirical_quantile(sample, 0.9));
}

TEST(TestCore_MathHelper, EmpiricalQuantileInvalidInputThrows) {
    using namespace ithim::core;

    ASSERT_THROW(MathHelper::empirical_quantile({}, 0.5), std::invalid_argument);
    ASSERT_THROW(MathHelper::empirical_quantile({1.0, 2.0}, 1.5), NumericDomainError);
}
