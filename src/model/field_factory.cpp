#include "rtcsv/field_factory.hpp"

namespace rtcsv {

Field DataFieldFactory::create_field(std::string_view raw, std::string_view enclosure) const {
  FieldOptions opts;
  opts.country = country_;
  opts.diag = diag_;
  return Field(raw, enclosure, opts);
}

Field HeaderFieldFactory::create_field(std::string_view raw, std::string_view enclosure) const {
  FieldOptions opts;
  opts.country = country_;
  opts.infer_types = false;
  return Field(raw, enclosure, opts);
}

std::unique_ptr<FieldFactory> make_field_factory(LineFormat format, Country country, DiagnosticSink* diag) {
  switch (format) {
    case LineFormat::Header: return std::make_unique<HeaderFieldFactory>(country);
    case LineFormat::Data:   break;
  }
  return std::make_unique<DataFieldFactory>(country, diag);
}

}
