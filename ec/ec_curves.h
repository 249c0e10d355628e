#ifndef ECBASE_EC_EC_CURVES_H_INCLUDED
#define ECBASE_EC_EC_CURVES_H_INCLUDED

#include <string>
#include <vector>

#include <ec/ec.h>
#include <ec/ec_weierstrass.h>
#include <ec/ec_edwards.h>

namespace ecbase { namespace ec {

struct weierstrass_domain {
    short_weierstrass_curve curve;
    point G; // base point (Gx, Gy, 1)
    field_elem n; // prime 'n' - order of base point
};

struct edwards_domain {
    twisted_edwards_curve curve; // curve.order() is the order of B
    point B; // base point (Bx, By, 1)
};

extern const weierstrass_domain secp256r1;
extern const weierstrass_domain secp384r1;
extern const weierstrass_domain secp256k1;

extern const edwards_domain ed25519;
extern const edwards_domain ed448;

const std::vector<std::string>& curve_names();
// Throws std::runtime_error for unknown names
const curve& curve_from_name(const std::string& name);

} } // namespace ecbase::ec

#endif
