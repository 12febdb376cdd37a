//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <bit>
#include <fstream>
#include <string>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

#include <Facet/Base/Logging.h>
#include <Facet/Writer/Internal/WriterOptions_schema.h>
#include <Facet/Writer/WriterOptions.h>

namespace facet::writer {

namespace {

  using nlohmann::json;
  using nlohmann::json_schema::basic_error_handler;
  using nlohmann::json_schema::json_validator;

  //! Writes one `ERROR:` line per schema violation as it is found.
  class StreamingErrorHandler final : public basic_error_handler {
  public:
    explicit StreamingErrorHandler(std::ostream& out)
      : out_(out)
    {
    }

    void error(const json::json_pointer& ptr, const json& instance,
      const std::string& message) override
    {
      basic_error_handler::error(ptr, instance, message);
      const auto key = ptr.to_string();
      out_ << "ERROR: writer options " << (key.empty() ? "<root>" : key)
           << ": " << message << " (value=" << instance.dump() << ")\n";
    }

  private:
    std::ostream& out_;
  };

  auto OptionsValidator() -> json_validator&
  {
    static json_validator validator = [] {
      json_validator v;
      v.set_root_schema(json::parse(kWriterOptionsSchema));
      return v;
    }();
    return validator;
  }

  auto ContainerModeFromString(const std::string& value) -> ContainerMode
  {
    return value == "embedded" ? ContainerMode::kEmbedded
                               : ContainerMode::kExternal;
  }

} // namespace

auto WriterOptions::FromJson(const nlohmann::json& json_data,
  std::ostream& error_stream) -> std::optional<WriterOptions>
{
  StreamingErrorHandler handler(error_stream);
  [[maybe_unused]] auto patch = OptionsValidator().validate(json_data, handler);
  if (handler) {
    return std::nullopt;
  }

  WriterOptions options {};
  // The schema restricts the value to "embedded" or "external".
  if (const auto it = json_data.find("container"); it != json_data.end()) {
    options.container_mode = ContainerModeFromString(it->get<std::string>());
  }
  options.image_basename
    = json_data.value("image_basename", options.image_basename);
  options.buffer_basename
    = json_data.value("buffer_basename", options.buffer_basename);
  options.multiple_images
    = json_data.value("multiple_images", options.multiple_images);
  options.multiple_buffers
    = json_data.value("multiple_buffers", options.multiple_buffers);
  options.blob_alignment
    = json_data.value("blob_alignment", options.blob_alignment);

  if (!std::has_single_bit(options.blob_alignment)) {
    error_stream << "ERROR: 'blob_alignment' must be a power of two\n";
    return std::nullopt;
  }

  DLOG_F(1, "Writer options: container={} images='{}' buffers='{}' align={}",
    to_string(options.container_mode), options.image_basename,
    options.buffer_basename, options.blob_alignment);

  return options;
}

auto WriterOptions::Load(const std::filesystem::path& options_path,
  std::ostream& error_stream) -> std::optional<WriterOptions>
{
  std::ifstream input(options_path);
  if (!input) {
    error_stream << "ERROR: failed to open writer options: "
                 << options_path.string() << "\n";
    return std::nullopt;
  }

  const auto json_data = nlohmann::json::parse(input, nullptr, false);
  if (json_data.is_discarded()) {
    error_stream << "ERROR: invalid writer options JSON: "
                 << options_path.string() << "\n";
    return std::nullopt;
  }
  return FromJson(json_data, error_stream);
}

} // namespace facet::writer
