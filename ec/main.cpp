#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <ec/ec.h>
#include <ec/ec_curves.h>
#include <int_util/int_util.h>

using namespace ecbase;

namespace {

void usage(const char* program)
{
    std::cerr << "Usage: " << program << " command [args...]\n";
    std::cerr << "  list                       List the known curves\n";
    std::cerr << "  check    <curve>           Validate the curve parameters\n";
    std::cerr << "  contains <curve> <x> <y>   Test if (x, y) is on the curve\n";
    std::cerr << "  lift     <curve> <x>       Find a point with x-coordinate x\n";
    std::cerr << "  negate   <curve> <x> <y>   Negate the point (x, y)\n";
    std::cerr << "Numbers are decimal or hex with a 0x prefix\n";
}

ec::field_elem parse_field_elem(const std::string& s)
{
    try {
        return ec::field_elem(s);
    } catch (const std::runtime_error&) {
        throw std::runtime_error("Invalid number \"" + s + "\"");
    }
}

void list_curves(std::ostream& out)
{
    for (const auto& name : ec::curve_names()) {
        const ec::curve& c = ec::curve_from_name(name);
        out << name << ": " << bit_length(c.p()) << " bit prime, baselen " << c.baselen() << ", cofactor ";
        if (auto w = dynamic_cast<const ec::short_weierstrass_curve*>(&c)) {
            if (w->cofactor()) {
                out << *w->cofactor();
            } else {
                out << "-";
            }
        } else if (auto e = dynamic_cast<const ec::twisted_edwards_curve*>(&c)) {
            out << e->cofactor();
        }
        out << "\n";
    }
}

} // unnamed namespace

int main(int argc, char* argv[])
{
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "list" && args.empty()) {
            list_curves(std::cout);
        } else if (command == "check" && args.size() == 1) {
            ec::curve_from_name(args[0]).check();
            std::cout << "OK" << std::endl;
        } else if (command == "contains" && args.size() == 3) {
            const ec::curve& c = ec::curve_from_name(args[0]);
            std::cout << std::boolalpha << c.contains_point(parse_field_elem(args[1]), parse_field_elem(args[2])) << std::endl;
        } else if (command == "lift" && args.size() == 2) {
            const ec::curve& c = ec::curve_from_name(args[0]);
            std::cout << c.lift_x(parse_field_elem(args[1])) << std::endl;
        } else if (command == "negate" && args.size() == 3) {
            const ec::curve& c = ec::curve_from_name(args[0]);
            std::cout << c.negate(ec::point{parse_field_elem(args[1]), parse_field_elem(args[2]), 1}) << std::endl;
        } else {
            usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
