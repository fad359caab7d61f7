#pragma once

#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

// kvbackend: the minimal key-value interface the digest_store needs.
// Keys and values are opaque strings.  Each call is atomic on its
// own:  a concurrent get never sees a partially written value.
// Implementations must be thread-safe.
//
// get(key, &value) - returns false if key isn't there.
// set(key, value) - unconditional overwrite.
// del(key) - deleting an absent key is not an error.
// keys() - a snapshot of all the keys.  Keys added or removed while
//     the caller iterates over the snapshot may or may not be there.
// compact() - reclaim space after a lot of deletions.  May be a no-op.
//
// All failures (I/O errors, a corrupt database file, etc.) are
// reported by throwing store_error.

namespace digest123{

struct store_error : public std::runtime_error{
    explicit store_error(const std::string& what) : std::runtime_error(what){}
};

struct kvbackend{
    virtual bool get(const std::string& key, std::string* value) = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual void del(const std::string& key) = 0;
    virtual std::vector<std::string> keys() = 0;
    virtual void compact() = 0;
    virtual std::ostream& report_stats(std::ostream& os){ return os; }
    virtual ~kvbackend(){}
};

// make_backend - construct a backend from a "store spec":
//
//    memory:         an in-process std::map.  Gone when the process exits.
//    sqlite:<path>   an SQLite database file, created if necessary.
//
// Throws std::invalid_argument for anything else, and store_error if
// the backend can't be opened.
std::unique_ptr<kvbackend> make_backend(const std::string& spec);

} // namespace digest123
