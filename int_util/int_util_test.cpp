#include "int_util.h"
#include "int.h"
#include <util/test.h>
#include <iostream>
#include <stdexcept>

using namespace ecbase;

namespace {

// Euler's criterion, only usable for small primes
int legendre_brute_force(int a, int p)
{
    a %= p;
    if (a < 0) a += p;
    if (a == 0) return 0;
    for (int y = 1; y < p; ++y) {
        if ((y * y) % p == a) return 1;
    }
    return -1;
}

const large_uint p25519 = (large_uint(1) << 255) - 19;                     // 5 mod 8
const large_uint p224   = (large_uint(1) << 224) - (large_uint(1) << 96) + 1; // 1 mod 8, 2-adic order 96
const large_uint p256k1("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEFFFFFC2F"); // 3 mod 4

} // unnamed namespace

void test_pmod()
{
    ECBASE_ASSERT_EQUAL(2, pmod(12, 5));
    ECBASE_ASSERT_EQUAL(3, pmod(-12, 5));
    ECBASE_ASSERT_EQUAL(0, pmod(-10, 5));
    ECBASE_ASSERT_EQUAL(large_uint(4), pmod(large_uint(-1), large_uint(5)));
    ECBASE_ASSERT_EQUAL(large_uint(p25519 - 1), pmod(large_uint(-1), p25519));
}

void test_modular_inverse()
{
    ECBASE_ASSERT_EQUAL(large_uint(4), modular_inverse(large_uint(3), large_uint(11)));
    ECBASE_ASSERT_EQUAL(large_uint(1), pmod(large_uint(121666) * modular_inverse(large_uint(121666), p25519), p25519));
    ECBASE_ASSERT_EQUAL(large_uint(3), div_mod(large_uint(12), large_uint(4), large_uint(13)));
    ECBASE_ASSERT_THROWS(modular_inverse(large_uint(6), large_uint(9)), std::runtime_error);
}

void test_bit_length()
{
    ECBASE_ASSERT_EQUAL(0U, bit_length(large_uint(0)));
    ECBASE_ASSERT_EQUAL(1U, bit_length(large_uint(1)));
    ECBASE_ASSERT_EQUAL(8U, bit_length(large_uint(255)));
    ECBASE_ASSERT_EQUAL(9U, bit_length(large_uint(256)));
    ECBASE_ASSERT_EQUAL(255U, bit_length(p25519));
    ECBASE_ASSERT_EQUAL(256U, bit_length(p256k1));
    ECBASE_ASSERT_THROWS(bit_length(large_uint(-1)), std::runtime_error);

    ECBASE_ASSERT_EQUAL(0U, byte_length(large_uint(0)));
    ECBASE_ASSERT_EQUAL(1U, byte_length(large_uint(255)));
    ECBASE_ASSERT_EQUAL(2U, byte_length(large_uint(256)));
    ECBASE_ASSERT_EQUAL(32U, byte_length(p25519));
    ECBASE_ASSERT_EQUAL(32U, byte_length(p256k1));
    ECBASE_ASSERT_EQUAL(28U, byte_length(p224));
}

void test_is_prime()
{
    ECBASE_ASSERT_EQUAL(false, is_prime(large_uint(0)));
    ECBASE_ASSERT_EQUAL(false, is_prime(large_uint(1)));
    ECBASE_ASSERT_EQUAL(true, is_prime(large_uint(2)));
    ECBASE_ASSERT_EQUAL(true, is_prime(large_uint(97)));
    ECBASE_ASSERT_EQUAL(false, is_prime(large_uint(91)));
    ECBASE_ASSERT_EQUAL(true, is_prime(p25519));
    ECBASE_ASSERT_EQUAL(true, is_prime(p224));
    ECBASE_ASSERT_EQUAL(false, is_prime(large_uint(p25519 + 2)));
}

void test_jacobi()
{
    for (int p : {3, 5, 7, 11, 13, 17, 41, 97, 101, 103}) {
        for (int a = -p; a < 2 * p; ++a) {
            ECBASE_ASSERT_EQUAL_MESSAGE(legendre_brute_force(a, p), jacobi(large_uint(a), large_uint(p)), "a=" << a << " p=" << p);
        }
    }
    // Composite moduli: (2/15) = 1, (7/15) = -1, (5/15) = 0
    ECBASE_ASSERT_EQUAL(1, jacobi(2, 15));
    ECBASE_ASSERT_EQUAL(-1, jacobi(7, 15));
    ECBASE_ASSERT_EQUAL(0, jacobi(5, 15));
    ECBASE_ASSERT_EQUAL(-1, jacobi(large_uint(2), p25519));
    ECBASE_ASSERT_EQUAL(1, jacobi(large_uint(4), p256k1));
    ECBASE_ASSERT_EQUAL(0, jacobi(p224, p224));

    ECBASE_ASSERT_THROWS(jacobi(1, 8), std::runtime_error);
    ECBASE_ASSERT_THROWS(jacobi(1, 1), std::runtime_error);
}

void check_sqrt(const large_uint& a, const large_uint& p)
{
    const large_uint y = sqrt_mod_prime(a, p);
    ECBASE_ASSERT_BINARY_MESSAGE(y, <, p, "a=" << a << " p=" << p);
    ECBASE_ASSERT_EQUAL_MESSAGE(pmod(a, p), pmod(y * y, p), "a=" << a << " p=" << p);
}

void test_sqrt_mod_prime()
{
    // Every residue class branch: 3 mod 4, 5 mod 8 and 1 mod 8
    for (int p : {2, 3, 7, 103, 5, 13, 101, 17, 41, 97}) {
        for (int a = 0; a < p; ++a) {
            if (legendre_brute_force(a, p) == -1) {
                ECBASE_ASSERT_THROWS(sqrt_mod_prime(large_uint(a), large_uint(p)), std::runtime_error);
            } else {
                check_sqrt(a, p);
            }
        }
    }

    for (const large_uint& p : {p25519, p224, p256k1}) {
        for (int i = 1; i < 20; ++i) {
            const large_uint r = (large_uint(1) << (i * 11)) + 12345 * i;
            check_sqrt(pmod(r * r, p), p);
        }
    }

    // 2 is a non-residue modulo 2^255-19
    ECBASE_ASSERT_THROWS(sqrt_mod_prime(large_uint(2), p25519), std::runtime_error);
    ECBASE_ASSERT_EQUAL(large_uint(0), sqrt_mod_prime(p25519, p25519));
}

int main()
{
    test_pmod();
    test_modular_inverse();
    test_bit_length();
    test_is_prime();
    test_jacobi();
    test_sqrt_mod_prime();
    std::cout << "int_util tests passed" << std::endl;
}
