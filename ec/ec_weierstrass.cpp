#include "ec_weierstrass.h"
#include <ostream>
#include <boost/container_hash/hash.hpp>

#include <int_util/int_util.h>
#include <util/test.h>

namespace ecbase { namespace ec {

short_weierstrass_curve::short_weierstrass_curve(const field_elem& p, const field_elem& a, const field_elem& b, const boost::optional<field_elem>& h)
    : p_(p), a_(a), b_(b), h_(h) {
}

field_elem short_weierstrass_curve::rhs(const field_elem& x) const {
    return pmod(field_elem(powm(pmod(x, p_), 3, p_)) + a_ * x + b_, p_);
}

size_t short_weierstrass_curve::baselen() const {
    return byte_length(p_);
}

size_t short_weierstrass_curve::verifying_key_length() const {
    throw not_implemented("verifying_key_length is not defined for short Weierstrass curves");
}

bool short_weierstrass_curve::contains_point(const field_elem& x, const field_elem& y) const {
    return pmod(y * y - ((x * x + a_) * x + b_), p_) == 0;
}

bool short_weierstrass_curve::is_x_coord(const field_elem& x) const {
    if (p_ == 2) {
        // Every element of GF(2) is its own square
        return true;
    }
    return jacobi(rhs(x), p_) != -1;
}

point short_weierstrass_curve::lift_x(const field_elem& x) const {
    const field_elem v = rhs(x);
    ECBASE_CHECK_BINARY_THROW(is_x_coord(x), ==, true, "No point with x-coordinate " << x, no_such_point);
    const field_elem y = sqrt_mod_prime(v, p_);
    assert(contains_point(x, y));
    return {x, y, 1};
}

point short_weierstrass_curve::negate(const point& pt) const {
    return {pt.x, pmod(p_ - pt.y, p_), pt.z};
}

void short_weierstrass_curve::check() const {
    static const char* deferrmsg = "Invalid curve parameter";
    ECBASE_CHECK_BINARY(is_prime(p_), ==, true, deferrmsg);
    ECBASE_CHECK_BINARY(field_elem(p_ & 1), ==, 1, "Invalid curve: p must be odd");
    ECBASE_CHECK_BINARY(a_, >=, 0, deferrmsg);
    ECBASE_CHECK_BINARY(a_, <,  p_, deferrmsg);
    ECBASE_CHECK_BINARY(b_, >=, 0, deferrmsg);
    ECBASE_CHECK_BINARY(b_, <,  p_, deferrmsg);

    // 4*a^3 + 27*b^2 != 0 (mod p)
    const field_elem discriminant = pmod(4 * field_elem(powm(a_, 3, p_)) + 27 * field_elem(powm(b_, 2, p_)), p_);
    ECBASE_CHECK_BINARY(discriminant, !=, 0, "Invalid elliptic curve: 4*a^3 + 27*b^2 == 0 (mod p)");

    if (h_) {
        ECBASE_CHECK_BINARY(*h_, >, 0, "Invalid curve: Invalid co factor");
    }
}

bool short_weierstrass_curve::equals(const curve& other) const {
    const auto o = dynamic_cast<const short_weierstrass_curve*>(&other);
    return o && *this == *o;
}

size_t short_weierstrass_curve::hash() const {
    size_t seed = 0;
    boost::hash_combine(seed, p_);
    boost::hash_combine(seed, a_);
    boost::hash_combine(seed, b_);
    boost::hash_combine(seed, static_cast<bool>(h_));
    if (h_) {
        boost::hash_combine(seed, *h_);
    }
    return seed;
}

void short_weierstrass_curve::print(std::ostream& os) const {
    os << "short_weierstrass_curve{p=" << p_ << ", a=" << a_ << ", b=" << b_ << ", h=";
    if (h_) {
        os << *h_;
    } else {
        os << "-";
    }
    os << "}";
}

bool operator==(const short_weierstrass_curve& lhs, const short_weierstrass_curve& rhs) {
    return lhs.p() == rhs.p() && lhs.a() == rhs.a() && lhs.b() == rhs.b() && lhs.cofactor() == rhs.cofactor();
}

} } // namespace ecbase::ec
