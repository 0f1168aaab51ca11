#pragma once
#include <string>
#include <string_view>

namespace rs {

// Qualified tag strings the boundary scanner matches against.
struct TagPattern {
  std::string local_name;     // e.g. "Product"
  std::string prefix;         // empty when records are unprefixed
  std::string namespace_uri;  // URI bound to `prefix` (or the default xmlns)
  std::string open_tag;       // "<p:Product" or "<Product"
  std::string close_tag;      // "</p:Product>" or "</Product>"

  bool namespace_detected() const noexcept { return !namespace_uri.empty() || !prefix.empty(); }
};

TagPattern make_tag_pattern(std::string_view local_name, std::string_view prefix = {});

class TagResolver {
public:
  struct Config {
    std::string local_name     = "Product";
    std::string namespace_hint = "onix";  // prefer a declared prefix whose URI contains this
  };

  explicit TagResolver(Config cfg);

  // Inspect the document head once and derive the record tag pattern.
  // Falls back to the unprefixed form when nothing qualifies the record.
  TagPattern detect(std::string_view head) const;

private:
  Config cfg_;
};

}
