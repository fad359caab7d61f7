#include "digest123/memory_backend.hpp"

namespace digest123{

bool
memory_backend::get(const std::string& key, std::string* value){
    std::lock_guard<std::mutex> lg(mtx);
    auto p = m.find(key);
    if(p == m.end())
        return false;
    *value = p->second;
    return true;
}

void
memory_backend::set(const std::string& key, const std::string& value){
    std::lock_guard<std::mutex> lg(mtx);
    m[key] = value;
}

void
memory_backend::del(const std::string& key){
    std::lock_guard<std::mutex> lg(mtx);
    m.erase(key);
}

std::vector<std::string>
memory_backend::keys(){
    std::lock_guard<std::mutex> lg(mtx);
    std::vector<std::string> ret;
    ret.reserve(m.size());
    for(const auto& kv : m)
        ret.push_back(kv.first);
    return ret;
}

std::ostream&
memory_backend::report_stats(std::ostream& os){
    std::lock_guard<std::mutex> lg(mtx);
    return os << "memory_backend_entries: " << m.size() << "\n";
}

} // namespace digest123
