#ifndef ECBASE_INT_UTIL_INT_UTIL_H_INCLUDED
#define ECBASE_INT_UTIL_INT_UTIL_H_INCLUDED

#include <cassert>
#include <cstddef>
#include <utility>

#ifdef _MSC_VER
#pragma warning(disable: 4319) // C4319: '~': zero extending 'const unsigned long' to 'boost::multiprecision::double_limb_type' of greater size
#pragma warning(disable: 4193) // C4193 : #pragma warning(pop) : no matching '#pragma warning(push)'
#endif
#include <boost/multiprecision/miller_rabin.hpp>

#include <util/test.h>

namespace ecbase {

template<typename a_expr, typename IntType>
IntType pmod(const a_expr& a, const IntType& p) {
    IntType res = a % p;
    if (res < 0) res += p;
    assert(res >= 0 && res < p);
    return res;
}

template<typename a_expr, typename IntType>
IntType modular_inverse(const a_expr& a, const IntType& n)
{
    ECBASE_CHECK_BINARY(n, >, 0, "Invalid modulus");
    IntType r = n, newr = pmod(a, n);
    IntType t = 0, newt = 1;
    while (newr != 0) {
        IntType quotient = r / newr;
        IntType saved = newt;
        newt = t - quotient * saved;
        t = saved;
        saved = newr;
        newr = r - quotient * saved;
        r = saved;
    }
    ECBASE_CHECK_BINARY(r, ==, 1, "Value not invertible");
    if (t < 0) t += n;
    assert(pmod(a*t, n) == 1);
    return t;
}

template<typename a_expr, typename b_expr, typename IntType>
IntType div_mod(const a_expr& a, const b_expr& b, const IntType& n)
{
    return pmod(a * modular_inverse(b, n), n);
}

// Number of significant bits in n (0 for n == 0)
template<typename IntType>
size_t bit_length(const IntType& n)
{
    ECBASE_CHECK_BINARY(n, >=, 0, "Bit length of negative value");
    if (n == 0) {
        return 0;
    }
    return static_cast<size_t>(msb(n)) + 1;
}

// Number of bytes needed to hold any value less than n
template<typename IntType>
size_t byte_length(const IntType& n)
{
    return (bit_length(n) + 7) / 8;
}

template<typename IntType>
bool is_prime(const IntType& n) {
    if (n < 2) return false;
    return miller_rabin_test(n, 25);
}

//
// Jacobi symbol (a/n) for odd n >= 3. Returns -1, 0 or 1.
// For prime n this is the Legendre symbol: 1 for a non-zero quadratic residue,
// -1 for a non-residue and 0 when n divides a.
//
template<typename a_expr, typename IntType>
int jacobi(const a_expr& a_in, const IntType& n)
{
    ECBASE_CHECK_BINARY(n, >=, 3, "Jacobi symbol needs a modulus of at least 3");
    ECBASE_CHECK_BINARY(IntType(n & 1), ==, 1, "Jacobi symbol needs an odd modulus");

    IntType a = pmod(a_in, n);
    IntType m = n;
    int result = 1;
    while (a != 0) {
        while ((a & 1) == 0) {
            a >>= 1;
            const IntType m_mod_8 = m & 7;
            if (m_mod_8 == 3 || m_mod_8 == 5) {
                result = -result;
            }
        }
        std::swap(a, m);
        if (IntType(a & 3) == 3 && IntType(m & 3) == 3) {
            result = -result;
        }
        a %= m;
    }
    return m == 1 ? result : 0;
}

//
// Returns y such that y*y == a (mod p) for prime p.
// Throws if a is a quadratic non-residue. Which of the two roots is returned is unspecified.
//
template<typename a_expr, typename IntType>
IntType sqrt_mod_prime(const a_expr& a_in, const IntType& p)
{
    ECBASE_CHECK_BINARY(p, >=, 2, "Invalid prime modulus");
    const IntType a = pmod(a_in, p);
    if (a == 0) {
        return 0;
    }
    if (p == 2) {
        return a;
    }
    ECBASE_CHECK_BINARY(jacobi(a, p), ==, 1, "Value has no square root modulo p");

    IntType res;
    if (IntType(p & 3) == 3) {
        res = IntType(powm(a, IntType((p + 1) >> 2), p));
    } else if (IntType(p & 7) == 5) {
        // Atkin: a^((p-1)/4) is +1 or -1 since a is a residue
        const IntType d = IntType(powm(a, IntType((p - 1) >> 2), p));
        if (d == 1) {
            res = IntType(powm(a, IntType((p + 3) >> 3), p));
        } else {
            assert(d == p - 1);
            res = pmod(2 * a * IntType(powm(IntType(4 * a), IntType((p - 5) >> 3), p)), p);
        }
    } else {
        // Tonelli-Shanks, p - 1 = q * 2^s with q odd
        IntType q = p - 1;
        unsigned s = 0;
        while ((q & 1) == 0) {
            q >>= 1;
            ++s;
        }
        IntType z = 2;
        while (jacobi(z, p) != -1) {
            ++z;
        }
        unsigned m = s;
        IntType c = IntType(powm(z, q, p));
        IntType t = IntType(powm(a, q, p));
        res = IntType(powm(a, IntType((q + 1) >> 1), p));
        while (t != 1) {
            // Least i, 0 < i < m, with t^(2^i) == 1
            unsigned i = 0;
            IntType t2i = t;
            while (t2i != 1) {
                t2i = pmod(t2i * t2i, p);
                ++i;
            }
            assert(i < m);
            IntType b = c;
            for (unsigned j = 0; j + 1 < m - i; ++j) {
                b = pmod(b * b, p);
            }
            m   = i;
            c   = pmod(b * b, p);
            t   = pmod(t * c, p);
            res = pmod(res * b, p);
        }
    }
    assert(pmod(res * res, p) == a);
    return res;
}

} // namespace ecbase

#endif
