#include "ITHIM.Core/exception.h"
#include "ITHIM.Core/string_util.h"
#include "ITHIM.Core/thread_util.h"
#include "pch.h"

#include <atomic>
#include <string>

TEST(TestCore, TrimAndLowerCase) {
    using namespace ithim::core;

    ASSERT_EQ("Walking", trim("  Walking \t"));
    ASSERT_EQ("", trim("   "));
    ASSERT_EQ("breastcancer", to_lower("BreastCancer"));
}

TEST(TestCore, CaseInsensitiveEquality) {
    using namespace ithim::core;

    ASSERT_TRUE(case_insensitive::equals("CVD", "cvd"));
    ASSERT_TRUE(case_insensitive::equals("ageClass", "AGECLASS"));
    ASSERT_FALSE(case_insensitive::equals("yll", "yld"));
    ASSERT_FALSE(case_insensitive::equals("daly", "dalys"));
}

TEST(TestCore, CaseInsensitiveIndexOf) {
    using namespace ithim::core;

    auto columns = std::vector<std::string>{"Mode", "AgeClass", "Sex", "Value"};
    ASSERT_EQ(1, case_insensitive::index_of(columns, "ageclass"));
    ASSERT_EQ(3, case_insensitive::index_of(columns, "VALUE"));
    ASSERT_EQ(-1, case_insensitive::index_of(columns, "disease"));
}

TEST(TestCore, ExceptionCarriesSourceLocation) {
    using namespace ithim::core;

    try {
        throw InputFormatError("Age classes out of order");
    } catch (const IthimException &ex) {
        auto what = std::string{ex.what()};
        ASSERT_EQ("Age classes out of order", std::string{ex.message()});
        ASSERT_NE(std::string::npos, what.find("Core.Test.cpp"));
        ASSERT_NE(std::string::npos, what.find("Age classes out of order"));
    }
}

TEST(TestCore, ExceptionTaxonomyDerivesFromRuntimeError) {
    using namespace ithim::core;

    ASSERT_THROW(throw InputFormatError("input"), std::runtime_error);
    ASSERT_THROW(throw ConfigurationError("config"), IthimException);
    ASSERT_THROW(throw MissingBurdenDataError("burden"), IthimException);
    ASSERT_THROW(throw NumericDomainError("numeric"), IthimException);
}

TEST(TestCore, ParallelForVisitsEveryIndexOnce) {
    using namespace ithim::core;

    auto visited = std::vector<std::atomic<int>>(100);
    parallel_for(std::size_t{0}, std::size_t{99},
                 [&visited](std::size_t index) { visited[index].fetch_add(1); });

    for (const auto &count : visited) {
        ASSERT_EQ(1, count.load());
    }
}

TEST(TestCore, RunAsyncReturnsResult) {
    using namespace ithim::core;

    auto future = run_async([](int a, int b) { return a + b; }, 2, 3);
    ASSERT_EQ(5, future.get());
}
