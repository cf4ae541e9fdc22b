#pragma once

#include <compare>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace xg {

  class qname {
    std::string namespace_uri_;
    std::string local_name_;

  public:
    qname() = default;

    qname(std::string namespace_uri, std::string local_name)
        : namespace_uri_(std::move(namespace_uri)),
          local_name_(std::move(local_name)) {}

    // Accepts "{uri}local" or a bare "local".
    static qname
    from_clark(std::string_view clark) {
      if (clark.starts_with('{')) {
        auto close = clark.find('}');
        if (close != std::string_view::npos) {
          return qname(std::string(clark.substr(1, close - 1)),
                       std::string(clark.substr(close + 1)));
        }
      }
      return qname("", std::string(clark));
    }

    const std::string&
    namespace_uri() const {
      return namespace_uri_;
    }

    const std::string&
    local_name() const {
      return local_name_;
    }

    bool
    empty() const {
      return local_name_.empty();
    }

    std::string
    clark() const {
      if (namespace_uri_.empty()) { return local_name_; }
      return '{' + namespace_uri_ + '}' + local_name_;
    }

    // OWL datatype/entity IRI: "uri#local".
    std::string
    iri() const {
      return namespace_uri_ + '#' + local_name_;
    }

    auto
    operator<=>(const qname&) const = default;

    bool
    operator==(const qname&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const qname& q) {
      return os << q.clark();
    }
  };

} // namespace xg

template <>
struct std::hash<xg::qname> {
  std::size_t
  operator()(const xg::qname& q) const noexcept {
    std::size_t h1 = std::hash<std::string>{}(q.namespace_uri());
    std::size_t h2 = std::hash<std::string>{}(q.local_name());
    return h1 ^ (h2 << 1);
  }
};
