#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace gazetteer
{

struct CommuneRecord
{
    std::string canonical_name;
    std::string region;
    // Explicit spellings on input; after Gazetteer::build, every surviving raw alias
    // (canonical name first)
    std::vector<std::string> aliases;
    std::size_t pharmacy_count = 0; // popularity, orders cold-start suggestions
};

enum class AliasKind
{
    Canonical,
    Explicit,
    Derived
};

struct AliasEntry
{
    std::string normalized; // unique key across the gazetteer
    std::string raw;        // first raw spelling that produced the key
    std::size_t commune = 0;
    AliasKind kind = AliasKind::Canonical;
};

// Reference data missing, unreadable or empty; the matcher cannot become ready
class DataUnavailableError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace gazetteer
