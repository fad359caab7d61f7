#pragma once

#include <ostream>

namespace dcore {

// base class from which all classes created by stats_struct_builder
// are derived.

struct stats_t {
    virtual ~stats_t() {}
    virtual std::ostream& osput(std::ostream& os) const = 0;
    friend std::ostream& operator<<(std::ostream& os, const stats_t& st) {
        return st.osput(os);
    }
};

} // namespace dcore
