#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace slideshow::config {

namespace {

constexpr char     kDefaultBindAddress[] = "0.0.0.0:50051";
constexpr uint32_t kDefaultOutputWidth   = 1920;
constexpr uint32_t kDefaultOutputHeight  = 1080;
constexpr uint64_t kDefaultTimeoutMs     = 600'000;
constexpr uint32_t kDefaultWorkers       = 2;
constexpr uint64_t kDefaultLogFileBytes  = 10 * 1024 * 1024;
constexpr uint32_t kDefaultLogFiles      = 3;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("8080" must not become a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

slideshow::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  slideshow::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(slideshow::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address(kDefaultBindAddress);

  auto* storage = config.mutable_storage();
  if (storage->images_dir().empty()) storage->set_images_dir("images");
  if (storage->videos_dir().empty()) storage->set_videos_dir("videos");
  if (storage->staging_dir().empty()) storage->set_staging_dir("staging");

  auto* encoder = config.mutable_encoder();
  if (encoder->binary().empty()) encoder->set_binary("ffmpeg");
  if (encoder->output_width() == 0) encoder->set_output_width(kDefaultOutputWidth);
  if (encoder->output_height() == 0) encoder->set_output_height(kDefaultOutputHeight);
  if (encoder->video_codec().empty()) encoder->set_video_codec("libx264");
  if (encoder->pixel_format().empty()) encoder->set_pixel_format("yuv420p");
  if (encoder->timeout_ms() == 0) encoder->set_timeout_ms(kDefaultTimeoutMs);
  if (!encoder->has_allow_placeholder()) encoder->set_allow_placeholder(true);

  auto* generation = config.mutable_generation();
  if (generation->workers() == 0) generation->set_workers(kDefaultWorkers);

  auto* logging = config.mutable_logging();
  if (!logging->file_path().empty()) {
    if (logging->max_file_bytes() == 0) logging->set_max_file_bytes(kDefaultLogFileBytes);
    if (logging->max_files() == 0) logging->set_max_files(kDefaultLogFiles);
  }
}

void ConfigLoader::Validate(const slideshow::runtime::config::RuntimeConfig& config) {
  if (config.storage().root_path().empty()) {
    throw std::runtime_error("Invalid configuration: storage.root_path is required");
  }
  if (config.encoder().output_width() % 2 != 0 || config.encoder().output_height() % 2 != 0) {
    throw std::runtime_error("Invalid configuration: encoder output dimensions must be even");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
}

} // namespace slideshow::config
