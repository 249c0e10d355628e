#ifndef ECBASE_EC_EC_EDWARDS_H_INCLUDED
#define ECBASE_EC_EC_EDWARDS_H_INCLUDED

#include <functional>

#include <ec/ec.h>

namespace ecbase { namespace ec {

//
// Twisted Edwards curve in GF(p) on the form a*x^2 + y^2 = 1 + d*x^2*y^2
//
// Encoded field elements carry an extra sign bit, so baselen is one bit
// longer than for the Weierstrass family. Recovering points from an
// x-coordinate and negation are left to the Edwards point arithmetic.
//
class twisted_edwards_curve final : public curve {
public:
    twisted_edwards_curve(const field_elem& p, const field_elem& a, const field_elem& d, const field_elem& h, const field_elem& order);

    const field_elem& p() const override { return p_; }
    const field_elem& a() const override { return a_; }
    const field_elem& d() const { return d_; }
    const field_elem& cofactor() const { return h_; }
    // Order of the prime order subgroup, not part of equality
    const field_elem& order() const { return order_; }

    size_t baselen() const override;
    size_t verifying_key_length() const override;

    bool contains_point(const field_elem& x, const field_elem& y) const override;
    bool is_x_coord(const field_elem& x) const override;
    point lift_x(const field_elem& x) const override;
    point negate(const point& pt) const override;

    void check() const override;

    bool equals(const curve& other) const override;
    size_t hash() const override;
    void print(std::ostream& os) const override;

private:
    field_elem p_;
    field_elem a_;
    field_elem d_;
    field_elem h_;
    field_elem order_;
};

bool operator==(const twisted_edwards_curve& lhs, const twisted_edwards_curve& rhs);

inline bool operator!=(const twisted_edwards_curve& lhs, const twisted_edwards_curve& rhs) {
    return !(lhs == rhs);
}

} } // namespace ecbase::ec

namespace std {
template<>
struct hash<ecbase::ec::twisted_edwards_curve> {
    size_t operator()(const ecbase::ec::twisted_edwards_curve& c) const {
        return c.hash();
    }
};
} // namespace std

#endif
