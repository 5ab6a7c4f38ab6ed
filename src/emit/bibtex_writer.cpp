#include "bibsane/emit/bibtex_writer.h"

#include "bibsane/emit/entry_sorter.h"

#include <algorithm>
#include <sstream>

namespace bibsane::emit {

namespace {

void write_field(std::ostringstream& out, const domain::Field& field) {
  out << "  " << field.name << " = {" << field.value << "},\n";
}

}  // namespace

std::string render_entry(const domain::Entry& entry,
                         const std::vector<std::string>& field_order) {
  std::ostringstream out;

  if (entry.is_preamble()) {
    out << "@preamble{\"" << entry.get("preamble").value_or("") << "\"}\n";
    return out.str();
  }

  out << "@" << entry.type_name << "{" << entry.key << ",\n";
  for (const auto& name : field_order) {
    for (const auto& field : entry.fields) {
      if (field.name == name) {
        write_field(out, field);
      }
    }
  }
  for (const auto& field : entry.fields) {
    if (std::find(field_order.begin(), field_order.end(), field.name) == field_order.end()) {
      write_field(out, field);
    }
  }
  out << "}\n";
  return out.str();
}

std::string render_bibliography(const std::vector<domain::Entry>& entries,
                                const std::vector<std::string>& field_order) {
  std::string text;
  for (const auto& entry : entries) {
    if (!text.empty()) {
      text += "\n";
    }
    text += render_entry(entry, field_order);
  }
  return text;
}

std::string sort_and_render(std::vector<domain::Entry>& entries, const config::Config& config) {
  if (config.sort) {
    sort_entries(entries, config.field_order);
  }
  return render_bibliography(entries, config.field_order);
}

}  // namespace bibsane::emit
