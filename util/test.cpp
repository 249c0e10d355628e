#include "test.h"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <stdexcept>

namespace ecbase { namespace test {

std::string describe_failure(const char* what, const char* func, const char* file, int line, const std::string& message)
{
    std::ostringstream oss;
    oss << what << " failed in " << func << " " << file << " line " << line << std::endl;
    oss << message;
    return oss.str();
}

void assert_failed(const char* func, const char* file, int line, const std::string& message)
{
    std::cerr << describe_failure("Assertion", func, file, line, message) << std::endl;
    std::abort();
}

void check_failed(const char* func, const char* file, int line, const std::string& message)
{
    throw_failure<std::runtime_error>(func, file, line, message);
}

} } // namespace ecbase::test
