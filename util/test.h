#ifndef ECBASE_UTIL_TEST_H_INCLUDED
#define ECBASE_UTIL_TEST_H_INCLUDED

#include <sstream>
#include <string>
#include <cstdlib>

namespace ecbase { namespace test {

std::string describe_failure(const char* what, const char* func, const char* file, int line, const std::string& message);

// Throws std::runtime_error describing the failed check
void check_failed(const char* func, const char* file, int line, const std::string& message);
// Prints the failure to stderr and aborts (used by the test programs)
void assert_failed(const char* func, const char* file, int line, const std::string& message);

template<typename Exception>
void throw_failure(const char* func, const char* file, int line, const std::string& message)
{
    throw Exception(describe_failure("Check", func, file, line, message));
}

} } // namespace ecbase::test

#define ECBASE_CHECK_FAILURE(msg) do {                                  \
    ecbase::test::check_failed(__PRETTY_FUNCTION__, __FILE__,           \
                    __LINE__, msg);                                     \
    std::abort();                                                       \
    } while (0)

#define ECBASE_ASSERT_THROWS_MESSAGE(expr, exception_type, message)     \
    do {                                                                \
        try {                                                           \
            expr;                                                       \
            std::ostringstream _ecbase_oss;                             \
            _ecbase_oss << "Expected " << #expr                         \
                << " to throw exception of type "                       \
                << #exception_type                                      \
                << "\n" << message;                                     \
            ecbase::test::assert_failed(__PRETTY_FUNCTION__, __FILE__,  \
                    __LINE__, _ecbase_oss.str());                       \
        } catch (const exception_type &) {}                             \
    } while(0)

#define ECBASE_ASSERT_THROWS(expr, exception_type) \
    ECBASE_ASSERT_THROWS_MESSAGE(expr, exception_type, "")

// Like ECBASE_ASSERT_THROWS, but also requires what() to contain 'needle'
#define ECBASE_ASSERT_THROWS_WHAT(expr, exception_type, needle)         \
    do {                                                                \
        bool _ecbase_thrown = false;                                    \
        try {                                                           \
            expr;                                                       \
        } catch (const exception_type& _ecbase_e) {                     \
            _ecbase_thrown = true;                                      \
            const std::string _ecbase_what = _ecbase_e.what();          \
            if (_ecbase_what.find(needle) == std::string::npos) {       \
                ecbase::test::assert_failed(__PRETTY_FUNCTION__,        \
                    __FILE__, __LINE__, "Expected \"" + std::string(needle) \
                    + "\" in exception message:\n" + _ecbase_what);    \
            }                                                           \
        }                                                               \
        if (!_ecbase_thrown) {                                          \
            ecbase::test::assert_failed(__PRETTY_FUNCTION__, __FILE__,  \
                    __LINE__, std::string("Expected ") + #expr          \
                    + " to throw " + #exception_type);                  \
        }                                                               \
    } while(0)

#define ECBASE_CHECK_BINARY_(expected, bin_op, actual, message, fail)   \
    do {                                                                \
        const auto _a_val = (expected);                                 \
        const auto _b_val = (actual);                                   \
        if (!(_a_val bin_op _b_val)) {                                  \
            std::ostringstream _ecbase_oss;                             \
            _ecbase_oss << "Expected:\n" << #expected << " "            \
                << #bin_op << " " << #actual << "\n"                    \
                << "Failure:\n"                                         \
                << "\"" << _a_val << "\"\n" << #bin_op << "\n\""        \
                << _b_val << "\"\n" << message;                         \
            fail(__PRETTY_FUNCTION__, __FILE__, __LINE__,               \
                    _ecbase_oss.str());                                 \
        }                                                               \
    } while (0)

#define ECBASE_ASSERT_BINARY_MESSAGE(expected, bin_op, actual, message) \
    ECBASE_CHECK_BINARY_(expected, bin_op, actual, message, ecbase::test::assert_failed)

#define ECBASE_ASSERT_EQUAL(expected, actual) ECBASE_ASSERT_BINARY_MESSAGE(expected, ==, actual, "")
#define ECBASE_ASSERT_EQUAL_MESSAGE(expected, actual, message) ECBASE_ASSERT_BINARY_MESSAGE(expected, ==, actual, message)

#define ECBASE_ASSERT_NOT_EQUAL(expected, actual) ECBASE_ASSERT_BINARY_MESSAGE(expected, !=, actual, "")
#define ECBASE_ASSERT_NOT_EQUAL_MESSAGE(expected, actual, message) ECBASE_ASSERT_BINARY_MESSAGE(expected, !=, actual, message)

#define ECBASE_CHECK_BINARY(expected, bin_op, actual, message) \
    ECBASE_CHECK_BINARY_(expected, bin_op, actual, message, ecbase::test::check_failed)

// Same as ECBASE_CHECK_BINARY, but throws 'exception_type' (constructible from std::string)
#define ECBASE_CHECK_BINARY_THROW(expected, bin_op, actual, message, exception_type) \
    ECBASE_CHECK_BINARY_(expected, bin_op, actual, message, ecbase::test::throw_failure<exception_type>)

#endif
