#include "ec.h"
#include <ostream>

namespace ecbase { namespace ec {

std::ostream& operator<<(std::ostream& os, const point& p) {
    return os << "(" << p.x << ", " << p.y << ", " << p.z << ")";
}

std::ostream& operator<<(std::ostream& os, const curve& c) {
    c.print(os);
    return os;
}

} } // namespace ecbase::ec
