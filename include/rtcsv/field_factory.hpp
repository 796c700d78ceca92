#pragma once
#include <memory>
#include <string_view>

#include "rtcsv/diagnostics.hpp"
#include "rtcsv/field.hpp"
#include "rtcsv/locale.hpp"

namespace rtcsv {

// Hook through which a line format decides how its cells are built.
class FieldFactory {
public:
  virtual ~FieldFactory() = default;
  virtual Field create_field(std::string_view raw, std::string_view enclosure) const = 0;
};

// Data cells: locale-aware type inference.
class DataFieldFactory : public FieldFactory {
public:
  explicit DataFieldFactory(Country country = Country::Germany, DiagnosticSink* diag = nullptr)
    : country_(country), diag_(diag) {}
  Field create_field(std::string_view raw, std::string_view enclosure) const override;

private:
  Country country_;
  DiagnosticSink* diag_;
};

// Header cells: column names, kept as literal text.
class HeaderFieldFactory : public FieldFactory {
public:
  explicit HeaderFieldFactory(Country country = Country::Germany) : country_(country) {}
  Field create_field(std::string_view raw, std::string_view enclosure) const override;

private:
  Country country_;
};

enum class LineFormat { Data, Header };

std::unique_ptr<FieldFactory> make_field_factory(LineFormat format,
                                                 Country country = Country::Germany,
                                                 DiagnosticSink* diag = nullptr);

}
