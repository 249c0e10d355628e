#ifndef ECBASE_EC_EC_H_INCLUDED
#define ECBASE_EC_EC_H_INCLUDED

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <cstddef>

#include <int_util/int.h>

namespace ecbase { namespace ec {

using field_elem = large_uint;

// Projective triple, affine points have z == 1
struct point {
    field_elem x;
    field_elem y;
    field_elem z;
};

inline bool operator==(const point& lhs, const point& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y && lhs.z == rhs.z;
}

inline bool operator!=(const point& lhs, const point& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const point& p);

// Thrown when an operation isn't available for the curve family
class not_implemented : public std::logic_error {
public:
    explicit not_implemented(const std::string& what) : std::logic_error(what) {}
};

// Thrown by lift_x when no point has the requested x-coordinate
class no_such_point : public std::runtime_error {
public:
    explicit no_such_point(const std::string& what) : std::runtime_error(what) {}
};

//
// Elliptic curve over GF(p). Instances are immutable once constructed.
//
class curve {
public:
    virtual ~curve() {}

    virtual const field_elem& p() const = 0; // field prime
    virtual const field_elem& a() const = 0; // curve 'a' parameter

    // Number of bytes used to encode a single field element
    virtual size_t baselen() const = 0;
    // Number of bytes in an encoded public key
    virtual size_t verifying_key_length() const = 0;

    virtual bool contains_point(const field_elem& x, const field_elem& y) const = 0;
    // true if some point on the curve has x as its x-coordinate
    virtual bool is_x_coord(const field_elem& x) const = 0;
    // Returns an affine point {x, y, 1} on the curve. The sign of y is unspecified.
    virtual point lift_x(const field_elem& x) const = 0;
    virtual point negate(const point& pt) const = 0;

    // Validates the curve parameters, throws std::runtime_error on failure
    virtual void check() const = 0;

    // Structural equality, curves of different families never compare equal
    virtual bool equals(const curve& other) const = 0;
    virtual size_t hash() const = 0;

    virtual void print(std::ostream& os) const = 0;
};

inline bool operator==(const curve& lhs, const curve& rhs) {
    return lhs.equals(rhs);
}

inline bool operator!=(const curve& lhs, const curve& rhs) {
    return !lhs.equals(rhs);
}

inline size_t hash_value(const curve& c) {
    return c.hash();
}

std::ostream& operator<<(std::ostream& os, const curve& c);

} } // namespace ecbase::ec

#endif
