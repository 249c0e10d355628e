#ifndef ECBASE_EC_EC_WEIERSTRASS_H_INCLUDED
#define ECBASE_EC_EC_WEIERSTRASS_H_INCLUDED

#include <functional>
#include <boost/optional.hpp>

#include <ec/ec.h>

namespace ecbase { namespace ec {

// Elliptic curve in GF(p) on the form y^2 = x^3 + ax + b
class short_weierstrass_curve final : public curve {
public:
    short_weierstrass_curve(const field_elem& p, const field_elem& a, const field_elem& b, const boost::optional<field_elem>& h = boost::none);

    const field_elem& p() const override { return p_; }
    const field_elem& a() const override { return a_; }
    const field_elem& b() const { return b_; }
    // Co factor #E(F_p)/n, absent if it wasn't supplied
    const boost::optional<field_elem>& cofactor() const { return h_; }

    size_t baselen() const override;
    // Not supported, the key length depends on the point encoding
    size_t verifying_key_length() const override;

    bool contains_point(const field_elem& x, const field_elem& y) const override;
    bool is_x_coord(const field_elem& x) const override;
    // Throws no_such_point if x^3 + ax + b is a quadratic non-residue
    point lift_x(const field_elem& x) const override;
    point negate(const point& pt) const override;

    void check() const override;

    bool equals(const curve& other) const override;
    size_t hash() const override;
    void print(std::ostream& os) const override;

private:
    field_elem p_;
    field_elem a_;
    field_elem b_;
    boost::optional<field_elem> h_;

    field_elem rhs(const field_elem& x) const;
};

bool operator==(const short_weierstrass_curve& lhs, const short_weierstrass_curve& rhs);

inline bool operator!=(const short_weierstrass_curve& lhs, const short_weierstrass_curve& rhs) {
    return !(lhs == rhs);
}

} } // namespace ecbase::ec

namespace std {
template<>
struct hash<ecbase::ec::short_weierstrass_curve> {
    size_t operator()(const ecbase::ec::short_weierstrass_curve& c) const {
        return c.hash();
    }
};
} // namespace std

#endif
