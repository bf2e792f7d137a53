#include "types/Rule.hpp"

namespace sm::types {

std::string to_string(const Direction d) {
    return d == Direction::Export ? "export" : "import";
}

}
