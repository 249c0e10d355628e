#include "ec_edwards.h"
#include <ostream>
#include <boost/container_hash/hash.hpp>

#include <int_util/int_util.h>
#include <util/test.h>

namespace ecbase { namespace ec {

twisted_edwards_curve::twisted_edwards_curve(const field_elem& p, const field_elem& a, const field_elem& d, const field_elem& h, const field_elem& order)
    : p_(p), a_(a), d_(d), h_(h), order_(order) {
}

size_t twisted_edwards_curve::baselen() const {
    return (bit_length(p_) + 1 + 7) / 8;
}

size_t twisted_edwards_curve::verifying_key_length() const {
    return baselen();
}

bool twisted_edwards_curve::contains_point(const field_elem& x, const field_elem& y) const {
    const field_elem x2 = x * x;
    const field_elem y2 = y * y;
    return pmod(a_ * x2 + y2 - 1 - d_ * x2 * y2, p_) == 0;
}

bool twisted_edwards_curve::is_x_coord(const field_elem&) const {
    throw not_implemented("is_x_coord is not supported for twisted Edwards curves");
}

point twisted_edwards_curve::lift_x(const field_elem&) const {
    throw not_implemented("lift_x is not supported for twisted Edwards curves");
}

point twisted_edwards_curve::negate(const point&) const {
    throw not_implemented("negate is not supported for twisted Edwards curves");
}

void twisted_edwards_curve::check() const {
    static const char* deferrmsg = "Invalid curve parameter";
    ECBASE_CHECK_BINARY(is_prime(p_), ==, true, deferrmsg);
    ECBASE_CHECK_BINARY(a_, >,  0, deferrmsg);
    ECBASE_CHECK_BINARY(a_, <,  p_, deferrmsg);
    ECBASE_CHECK_BINARY(d_, >,  0, deferrmsg);
    ECBASE_CHECK_BINARY(d_, <,  p_, deferrmsg);
    ECBASE_CHECK_BINARY(a_, !=, d_, "Invalid twisted Edwards curve: a == d");
    ECBASE_CHECK_BINARY(h_, >,  0, "Invalid curve: Invalid co factor");
    ECBASE_CHECK_BINARY(order_, >, 0, "Invalid curve: Invalid order");
}

bool twisted_edwards_curve::equals(const curve& other) const {
    const auto o = dynamic_cast<const twisted_edwards_curve*>(&other);
    return o && *this == *o;
}

size_t twisted_edwards_curve::hash() const {
    size_t seed = 0;
    boost::hash_combine(seed, p_);
    boost::hash_combine(seed, a_);
    boost::hash_combine(seed, d_);
    boost::hash_combine(seed, h_);
    return seed;
}

void twisted_edwards_curve::print(std::ostream& os) const {
    os << "twisted_edwards_curve{p=" << p_ << ", a=" << a_ << ", d=" << d_ << ", h=" << h_ << "}";
}

bool operator==(const twisted_edwards_curve& lhs, const twisted_edwards_curve& rhs) {
    return lhs.p() == rhs.p() && lhs.a() == rhs.a() && lhs.d() == rhs.d() && lhs.cofactor() == rhs.cofactor();
}

} } // namespace ecbase::ec
