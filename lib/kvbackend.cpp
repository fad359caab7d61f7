#include "digest123/kvbackend.hpp"
#include "digest123/memory_backend.hpp"
#include "digest123/sqlite_backend.hpp"
#include <dcore/strutils.hpp>

using namespace dcore;

namespace digest123{

std::unique_ptr<kvbackend>
make_backend(const std::string& spec){
    if(spec == "memory:")
        return std::make_unique<memory_backend>();
    if(startswith(spec, "sqlite:")){
        auto path = spec.substr(7);
        if(path.empty())
            throw std::invalid_argument("make_backend: sqlite: needs a path, e.g., sqlite:/var/lib/digest123/digests.db");
        return std::make_unique<sqlite_backend>(path);
    }
    throw std::invalid_argument("make_backend: unrecognized store spec: '" + spec + "'.  Expected memory: or sqlite:<path>");
}

} // namespace digest123
