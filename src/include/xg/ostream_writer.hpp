#pragma once

#include <xg/xml_writer.hpp>

#include <memory>
#include <ostream>

namespace xg {

  class ostream_writer : public xml_writer {
  public:
    // With `indent`, element-only content is laid out one child per line.
    explicit ostream_writer(std::ostream& os, bool indent = false);
    ~ostream_writer() override;

    ostream_writer(const ostream_writer&) = delete;
    ostream_writer&
    operator=(const ostream_writer&) = delete;
    ostream_writer(ostream_writer&&) noexcept;
    ostream_writer&
    operator=(ostream_writer&&) noexcept;

    void
    xml_declaration() override;

    void
    start_element(const qname& name) override;

    void
    end_element() override;

    void
    attribute(const qname& name, std::string_view value) override;

    void
    characters(std::string_view text) override;

    void
    namespace_declaration(std::string_view prefix,
                          std::string_view uri) override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace xg
