#pragma once
#include "output_types.hpp"
#include <expected>
#include <filesystem>
#include <hdf5.h>
#include <string>
#include <vector>

namespace orckit::io::output {

struct HDF5Config {
  int compression_level = 6;      // 0-9, higher = better compression
  bool use_shuffle_filter = true; // Reorder bytes for better compression
  std::size_t chunk_size = 1024;
};

// RAII wrapper for HDF5 handles
template <typename HandleType, auto CloseFunc> class HDF5Handle {
private:
  HandleType handle_;

public:
  explicit HDF5Handle(HandleType handle) : handle_(handle) {
    if (handle_ < 0) {
      throw OutputError("Invalid HDF5 handle");
    }
  }

  ~HDF5Handle() {
    if (handle_ >= 0) {
      CloseFunc(handle_);
    }
  }

  HDF5Handle(HDF5Handle&& other) noexcept : handle_(other.handle_) { other.handle_ = -1; }

  HDF5Handle& operator=(HDF5Handle&& other) noexcept {
    if (this != &other) {
      if (handle_ >= 0) {
        CloseFunc(handle_);
      }
      handle_ = other.handle_;
      other.handle_ = -1;
    }
    return *this;
  }

  HDF5Handle(const HDF5Handle&) = delete;
  HDF5Handle& operator=(const HDF5Handle&) = delete;

  [[nodiscard]] auto get() const noexcept -> HandleType { return handle_; }
  [[nodiscard]] auto valid() const noexcept -> bool { return handle_ >= 0; }

  // Implicit conversion for C API
  operator HandleType() const noexcept { return handle_; }
};

using FileHandle = HDF5Handle<hid_t, H5Fclose>;
using GroupHandle = HDF5Handle<hid_t, H5Gclose>;
using DatasetHandle = HDF5Handle<hid_t, H5Dclose>;
using DataspaceHandle = HDF5Handle<hid_t, H5Sclose>;
using PropertyHandle = HDF5Handle<hid_t, H5Pclose>;
using TypeHandle = HDF5Handle<hid_t, H5Tclose>;
using AttributeHandle = HDF5Handle<hid_t, H5Aclose>;

/**
 * @brief Writes one case to an HDF5 file
 *
 * Layout: /metadata (attributes), /heat_exchanger (scalars, boundary vectors, zones/,
 * h_conv_mean/) and /expander (scalars, ts_diagram/, internal/). Datasets carry
 * "units" and "description" attributes.
 */
class HDF5Writer {
private:
  HDF5Config hdf5_config_;

  [[nodiscard]] auto
  create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError>;

  [[nodiscard]] auto write_metadata(FileHandle& file,
                                    const OutputDataset& dataset) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_heat_exchanger(FileHandle& file,
                                          const hex::HexResult& result) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_zones(GroupHandle& hex_group,
                                 const std::vector<hex::Zone>& zones) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_expander(FileHandle& file, const expander::ExpanderResult& result) const
      -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_internal_states(GroupHandle& expander_group, const expander::InternalStates& states) const
      -> std::expected<void, OutputError>;

  [[nodiscard]] auto create_group(hid_t parent,
                                  const std::string& name) const -> std::expected<GroupHandle, OutputError>;

  [[nodiscard]] auto write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                                  const std::string& units = "",
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_scalar(hid_t parent, const std::string& name, double value, const std::string& units = "",
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  // String attribute on a group or dataset
  [[nodiscard]] auto write_string(hid_t parent, const std::string& name,
                                  const std::string& value) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto
  write_string_array(hid_t parent, const std::string& name,
                     const std::vector<std::string>& values) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto create_chunked_properties(std::size_t size) const -> std::expected<PropertyHandle, OutputError>;

public:
  explicit HDF5Writer(HDF5Config config = {}) : hdf5_config_(config) {}

  [[nodiscard]] auto write(const std::filesystem::path& file_path,
                           const OutputDataset& dataset) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto get_extension() const noexcept -> std::string_view { return ".h5"; }
};

// Convenience functions for HDF5
namespace hdf5 {

[[nodiscard]] auto check_version() -> std::expected<std::string, OutputError>;

[[nodiscard]] auto validate_file(const std::filesystem::path& file_path) -> std::expected<void, OutputError>;

// Post-processing readers, dataset paths are absolute ("/heat_exchanger/duty")
[[nodiscard]] auto read_scalar(const std::filesystem::path& file_path,
                               const std::string& dataset_path) -> std::expected<double, OutputError>;

[[nodiscard]] auto read_vector(const std::filesystem::path& file_path,
                               const std::string& dataset_path) -> std::expected<std::vector<double>, OutputError>;

[[nodiscard]] auto read_string_attribute(const std::filesystem::path& file_path, const std::string& object_path,
                                         const std::string& name) -> std::expected<std::string, OutputError>;

} // namespace hdf5

} // namespace orckit::io::output
