#pragma once

#include "kvbackend.hpp"
#include <map>
#include <mutex>

namespace digest123{

// memory_backend - a std::map under a mutex.  compact() does nothing.
struct memory_backend : public kvbackend{
    bool get(const std::string& key, std::string* value) override;
    void set(const std::string& key, const std::string& value) override;
    void del(const std::string& key) override;
    std::vector<std::string> keys() override;
    void compact() override {}
    std::ostream& report_stats(std::ostream& os) override;
private:
    std::mutex mtx;
    std::map<std::string, std::string> m;
};

} // namespace digest123
