#include "orckit/io/output/hdf5_writer.hpp"
#include "orckit/core/expected_utils.hpp"
#include <algorithm>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace orckit::io::output {

namespace {

using ObjectHandle = HDF5Handle<hid_t, H5Oclose>;

template <typename Getter>
[[nodiscard]] auto zone_vector(const std::vector<hex::Zone>& zones, Getter getter) -> std::vector<double> {
  std::vector<double> values;
  values.reserve(zones.size());
  for (const auto& zone : zones) {
    values.push_back(getter(zone));
  }
  return values;
}

} // namespace

auto HDF5Writer::write(const std::filesystem::path& file_path,
                       const OutputDataset& dataset) const -> std::expected<void, OutputError> {

  try {
    auto file_result = create_file(file_path);
    if (!file_result) {
      return std::unexpected(file_result.error());
    }
    auto file = std::move(file_result.value());

    if (auto meta_result = write_metadata(file, dataset); !meta_result) {
      return std::unexpected(meta_result.error());
    }

    if (dataset.heat_exchanger) {
      if (auto hex_result = write_heat_exchanger(file, *dataset.heat_exchanger); !hex_result) {
        return std::unexpected(hex_result.error());
      }
    }

    if (dataset.expander) {
      if (auto expander_result = write_expander(file, *dataset.expander); !expander_result) {
        return std::unexpected(expander_result.error());
      }
    }

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(OutputError(std::format("HDF5 write failed: {}", e.what())));
  }
}

auto HDF5Writer::create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError> {

  auto fapl = H5Pcreate(H5P_FILE_ACCESS);
  if (fapl < 0) {
    return std::unexpected(OutputError("Failed to create file access property list"));
  }

  H5Pset_fclose_degree(fapl, H5F_CLOSE_STRONG);

  auto file_id = H5Fcreate(file_path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, fapl);
  H5Pclose(fapl);

  if (file_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create HDF5 file: {}", file_path.string())));
  }

  return FileHandle(file_id);
}

auto HDF5Writer::write_metadata(FileHandle& file,
                                const OutputDataset& dataset) const -> std::expected<void, OutputError> {

  auto metadata_group_result = create_group(file, "metadata");
  if (!metadata_group_result) {
    return std::unexpected(metadata_group_result.error());
  }
  auto metadata_group = std::move(metadata_group_result.value());

  const auto& metadata = dataset.metadata;
  ORCKIT_TRY_VOID(write_string(metadata_group, "case_name", metadata.case_name));
  ORCKIT_TRY_VOID(write_string(metadata_group, "config_file", metadata.config_file));

  auto time_t = std::chrono::system_clock::to_time_t(metadata.creation_time);
  auto tm = *std::gmtime(&time_t);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  ORCKIT_TRY_VOID(write_string(metadata_group, "creation_time", oss.str()));

  if (auto version = hdf5::check_version()) {
    ORCKIT_TRY_VOID(write_string(metadata_group, "hdf5_version", *version));
  }

  if (dataset.heat_exchanger) {
    ORCKIT_TRY_VOID(write_string(metadata_group, "hex_model", dataset.heat_exchanger->model));
    ORCKIT_TRY_VOID(write_string(metadata_group, "hex_flag", std::to_string(dataset.heat_exchanger->flag_value())));
  }
  if (dataset.expander) {
    ORCKIT_TRY_VOID(write_string(metadata_group, "expander_model", dataset.expander->model));
    ORCKIT_TRY_VOID(write_string(metadata_group, "expander_flag", std::to_string(dataset.expander->flag_value())));
  }

  return {};
}

auto HDF5Writer::write_heat_exchanger(FileHandle& file,
                                      const hex::HexResult& result) const -> std::expected<void, OutputError> {

  auto group_result = create_group(file, "heat_exchanger");
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  ORCKIT_TRY_VOID(write_string(group, "model", result.model));
  ORCKIT_TRY_VOID(write_string(group, "reversed", result.reversed ? "true" : "false"));

  ORCKIT_TRY_VOID(write_scalar(group, "flag", result.flag_value(), "", "Solver status flag"));
  ORCKIT_TRY_VOID(write_scalar(group, "duty", result.duty, "W", "Heat duty"));
  ORCKIT_TRY_VOID(write_scalar(group, "duty_max", result.duty_max, "W", "Maximum transferable duty"));
  ORCKIT_TRY_VOID(write_scalar(group, "effectiveness", result.effectiveness, "", "Thermal effectiveness Q/Qmax"));
  ORCKIT_TRY_VOID(write_scalar(group, "pinch", result.pinch, "K", "Minimum temperature approach"));
  ORCKIT_TRY_VOID(write_scalar(group, "residual", result.residual, "", "Area or pinch residual"));
  ORCKIT_TRY_VOID(write_scalar(group, "iterations", result.iterations, "", "Root finder iterations"));
  ORCKIT_TRY_VOID(write_scalar(group, "h_hot_ex", result.h_hot_ex, "J/kg", "Hot exhaust enthalpy"));
  ORCKIT_TRY_VOID(write_scalar(group, "h_cold_ex", result.h_cold_ex, "J/kg", "Cold exhaust enthalpy"));
  ORCKIT_TRY_VOID(write_scalar(group, "T_hot_ex", result.T_hot_ex, "K", "Hot exhaust temperature"));
  ORCKIT_TRY_VOID(write_scalar(group, "T_cold_ex", result.T_cold_ex, "K", "Cold exhaust temperature"));
  ORCKIT_TRY_VOID(write_scalar(group, "mass_hot", result.mass_hot, "kg", "Hot side inventory"));
  ORCKIT_TRY_VOID(write_scalar(group, "mass_cold", result.mass_cold, "kg", "Cold side inventory"));

  // Boundary vectors, cold end first
  ORCKIT_TRY_VOID(write_vector(group, "duty_fraction", result.duty_fraction, "", "Cumulative duty fraction"));
  ORCKIT_TRY_VOID(write_vector(group, "geometric_fraction", result.geometric_fraction, "", "Cumulative area fraction"));
  ORCKIT_TRY_VOID(write_vector(group, "h_hot", result.h_hot, "J/kg"));
  ORCKIT_TRY_VOID(write_vector(group, "h_cold", result.h_cold, "J/kg"));
  ORCKIT_TRY_VOID(write_vector(group, "T_hot", result.T_hot, "K"));
  ORCKIT_TRY_VOID(write_vector(group, "T_cold", result.T_cold, "K"));
  ORCKIT_TRY_VOID(write_vector(group, "s_hot", result.s_hot, "J/(kg.K)"));
  ORCKIT_TRY_VOID(write_vector(group, "s_cold", result.s_cold, "J/(kg.K)"));
  ORCKIT_TRY_VOID(write_vector(group, "q_hot", result.q_hot, "", "Vapor quality, NaN outside the dome"));
  ORCKIT_TRY_VOID(write_vector(group, "q_cold", result.q_cold, "", "Vapor quality, NaN outside the dome"));

  auto mean_result = create_group(group, "h_conv_mean");
  if (!mean_result) {
    return std::unexpected(mean_result.error());
  }
  auto mean_group = std::move(mean_result.value());
  const std::string h_units = "W/(m2.K)";
  ORCKIT_TRY_VOID(write_scalar(mean_group, "hot_liquid", result.h_conv_hot_mean.liquid, h_units));
  ORCKIT_TRY_VOID(write_scalar(mean_group, "hot_two_phase", result.h_conv_hot_mean.two_phase, h_units));
  ORCKIT_TRY_VOID(write_scalar(mean_group, "hot_vapor", result.h_conv_hot_mean.vapor, h_units));
  ORCKIT_TRY_VOID(write_scalar(mean_group, "cold_liquid", result.h_conv_cold_mean.liquid, h_units));
  ORCKIT_TRY_VOID(write_scalar(mean_group, "cold_two_phase", result.h_conv_cold_mean.two_phase, h_units));
  ORCKIT_TRY_VOID(write_scalar(mean_group, "cold_vapor", result.h_conv_cold_mean.vapor, h_units));

  return write_zones(group, result.zones);
}

auto HDF5Writer::write_zones(GroupHandle& hex_group,
                             const std::vector<hex::Zone>& zones) const -> std::expected<void, OutputError> {

  auto zones_result = create_group(hex_group, "zones");
  if (!zones_result) {
    return std::unexpected(zones_result.error());
  }
  auto group = std::move(zones_result.value());

  if (zones.empty()) {
    return {};
  }

  std::vector<std::string> hot_phases;
  std::vector<std::string> cold_phases;
  for (const auto& zone : zones) {
    hot_phases.emplace_back(hex::phase_name(zone.hot_phase));
    cold_phases.emplace_back(hex::phase_name(zone.cold_phase));
  }
  ORCKIT_TRY_VOID(write_string_array(group, "hot_phase", hot_phases));
  ORCKIT_TRY_VOID(write_string_array(group, "cold_phase", cold_phases));

  using hex::Zone;
  ORCKIT_TRY_VOID(write_vector(group, "duty", zone_vector(zones, [](const Zone& z) { return z.duty(); }), "W"));
  ORCKIT_TRY_VOID(write_vector(group, "dt_log", zone_vector(zones, [](const Zone& z) { return z.dt_log; }), "K",
                               "Log-mean temperature difference"));
  ORCKIT_TRY_VOID(write_vector(group, "conductance", zone_vector(zones, [](const Zone& z) { return z.conductance; }),
                               "W/(m2.K)", "Overall coefficient referred to the hot side area"));
  ORCKIT_TRY_VOID(write_vector(group, "h_conv_hot", zone_vector(zones, [](const Zone& z) { return z.h_conv_hot; }),
                               "W/(m2.K)"));
  ORCKIT_TRY_VOID(write_vector(group, "h_conv_cold", zone_vector(zones, [](const Zone& z) { return z.h_conv_cold; }),
                               "W/(m2.K)"));
  ORCKIT_TRY_VOID(write_vector(group, "area_hot", zone_vector(zones, [](const Zone& z) { return z.area_hot; }), "m2"));
  ORCKIT_TRY_VOID(
      write_vector(group, "area_cold", zone_vector(zones, [](const Zone& z) { return z.area_cold; }), "m2"));
  ORCKIT_TRY_VOID(
      write_vector(group, "volume_hot", zone_vector(zones, [](const Zone& z) { return z.volume_hot; }), "m3"));
  ORCKIT_TRY_VOID(
      write_vector(group, "volume_cold", zone_vector(zones, [](const Zone& z) { return z.volume_cold; }), "m3"));
  ORCKIT_TRY_VOID(write_vector(group, "mass_hot", zone_vector(zones, [](const Zone& z) { return z.mass_hot; }), "kg"));
  ORCKIT_TRY_VOID(
      write_vector(group, "mass_cold", zone_vector(zones, [](const Zone& z) { return z.mass_cold; }), "kg"));
  ORCKIT_TRY_VOID(write_vector(group, "liquid_weight_hot",
                               zone_vector(zones, [](const Zone& z) { return z.liquid_weight_hot; }), "",
                               "Mean liquid volume fraction, two-phase zones only"));
  ORCKIT_TRY_VOID(write_vector(group, "liquid_weight_cold",
                               zone_vector(zones, [](const Zone& z) { return z.liquid_weight_cold; }), "",
                               "Mean liquid volume fraction, two-phase zones only"));
  return {};
}

auto HDF5Writer::write_expander(FileHandle& file, const expander::ExpanderResult& result) const
    -> std::expected<void, OutputError> {

  auto group_result = create_group(file, "expander");
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  ORCKIT_TRY_VOID(write_string(group, "model", result.model));

  ORCKIT_TRY_VOID(write_scalar(group, "flag", result.flag_value(), "", "Solver status flag"));
  ORCKIT_TRY_VOID(write_scalar(group, "T_su", result.T_su, "K", "Supply temperature"));
  ORCKIT_TRY_VOID(write_scalar(group, "h_su", result.h_su, "J/kg", "Supply enthalpy"));
  ORCKIT_TRY_VOID(write_scalar(group, "h_ex_s", result.h_ex_s, "J/kg", "Isentropic exhaust enthalpy"));
  ORCKIT_TRY_VOID(write_scalar(group, "T_ex", result.T_ex, "K", "Exhaust temperature"));
  ORCKIT_TRY_VOID(write_scalar(group, "h_ex", result.h_ex, "J/kg", "Exhaust enthalpy"));
  ORCKIT_TRY_VOID(write_scalar(group, "W_dot", result.power, "W", "Shaft power"));
  ORCKIT_TRY_VOID(write_scalar(group, "W_dot_s", result.isentropic_power, "W", "Isentropic power"));
  ORCKIT_TRY_VOID(write_scalar(group, "epsilon_is", result.isentropic_efficiency, "", "Isentropic efficiency"));
  ORCKIT_TRY_VOID(write_scalar(group, "FF", result.filling_factor, "", "Filling factor"));
  ORCKIT_TRY_VOID(write_scalar(group, "N_exp", result.speed, "rpm", "Rotational speed"));
  ORCKIT_TRY_VOID(write_scalar(group, "Q_dot_amb", result.ambient_loss, "W", "Ambient heat loss"));
  ORCKIT_TRY_VOID(write_scalar(group, "M", result.mass, "kg", "Retained mass"));
  ORCKIT_TRY_VOID(write_scalar(group, "T_wall", result.wall_temperature, "K", "Wall temperature"));
  ORCKIT_TRY_VOID(write_scalar(group, "residual", result.residual, "", "Closing residual"));
  ORCKIT_TRY_VOID(write_scalar(group, "iterations", result.iterations, "", "Root finder iterations"));

  auto ts_result = create_group(group, "ts_diagram");
  if (!ts_result) {
    return std::unexpected(ts_result.error());
  }
  auto ts_group = std::move(ts_result.value());
  const std::vector<double> ts_temperature(result.ts_temperature.begin(), result.ts_temperature.end());
  const std::vector<double> ts_entropy(result.ts_entropy.begin(), result.ts_entropy.end());
  ORCKIT_TRY_VOID(write_vector(ts_group, "T", ts_temperature, "K"));
  ORCKIT_TRY_VOID(write_vector(ts_group, "s", ts_entropy, "J/(kg.K)"));

  if (result.internal) {
    return write_internal_states(group, *result.internal);
  }
  return {};
}

auto HDF5Writer::write_internal_states(GroupHandle& expander_group, const expander::InternalStates& states) const
    -> std::expected<void, OutputError> {

  auto internal_result = create_group(expander_group, "internal");
  if (!internal_result) {
    return std::unexpected(internal_result.error());
  }
  auto group = std::move(internal_result.value());

  const std::vector<const expander::ThermoState*> chain = {&states.su1, &states.su2, &states.in,
                                                           &states.ex2, &states.ex1, &states.ex};
  std::vector<double> pressure;
  std::vector<double> enthalpy;
  std::vector<double> entropy;
  std::vector<double> density;
  for (const auto* state : chain) {
    pressure.push_back(state->pressure);
    enthalpy.push_back(state->enthalpy);
    entropy.push_back(state->entropy);
    density.push_back(state->density);
  }

  ORCKIT_TRY_VOID(write_string_array(group, "states", {"su1", "su2", "in", "ex2", "ex1", "ex"}));
  ORCKIT_TRY_VOID(write_vector(group, "P", pressure, "Pa"));
  ORCKIT_TRY_VOID(write_vector(group, "h", enthalpy, "J/kg"));
  ORCKIT_TRY_VOID(write_vector(group, "s", entropy, "J/(kg.K)"));
  ORCKIT_TRY_VOID(write_vector(group, "rho", density, "kg/m3"));

  ORCKIT_TRY_VOID(write_scalar(group, "T_su1", states.T_su1, "K"));
  ORCKIT_TRY_VOID(write_scalar(group, "T_ex1", states.T_ex1, "K"));
  ORCKIT_TRY_VOID(write_scalar(group, "gamma", states.gamma, "", "Heat capacity ratio at the supply"));
  ORCKIT_TRY_VOID(write_scalar(group, "P_thr", states.throat_pressure, "Pa", "Leakage throat pressure"));
  ORCKIT_TRY_VOID(write_scalar(group, "M_dot_leak", states.leakage_flow, "kg/s"));
  ORCKIT_TRY_VOID(write_scalar(group, "M_dot_in", states.internal_flow, "kg/s"));
  ORCKIT_TRY_VOID(write_scalar(group, "Q_dot_su", states.supply_heat, "W"));
  ORCKIT_TRY_VOID(write_scalar(group, "Q_dot_ex", states.exhaust_heat, "W"));
  ORCKIT_TRY_VOID(write_scalar(group, "W_dot_in", states.internal_power, "W"));
  ORCKIT_TRY_VOID(write_scalar(group, "W_dot_loss", states.loss_power, "W"));
  return {};
}

auto HDF5Writer::create_group(hid_t parent, const std::string& name) const -> std::expected<GroupHandle, OutputError> {

  auto group_id = H5Gcreate2(parent, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (group_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create group '{}'", name)));
  }
  return GroupHandle(group_id);
}

auto HDF5Writer::write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                              const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {

  if (data.empty()) {
    return {}; // Skip empty datasets
  }

  hsize_t dims = data.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_chunked_properties(data.size());
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  auto status = H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data());
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write data for '{}'", name)));
  }

  if (!units.empty()) {
    ORCKIT_TRY_VOID(write_string(dataset, "units", units));
  }
  if (!description.empty()) {
    ORCKIT_TRY_VOID(write_string(dataset, "description", description));
  }
  return {};
}

auto HDF5Writer::write_scalar(hid_t parent, const std::string& name, double value, const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create scalar dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create scalar dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  auto status = H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, &value);
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write scalar value for '{}'", name)));
  }

  if (!units.empty()) {
    ORCKIT_TRY_VOID(write_string(dataset, "units", units));
  }
  if (!description.empty()) {
    ORCKIT_TRY_VOID(write_string(dataset, "description", description));
  }
  return {};
}

auto HDF5Writer::write_string(hid_t parent, const std::string& name,
                              const std::string& value) const -> std::expected<void, OutputError> {

  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);

  // Zero-sized string types are rejected
  H5Tset_size(string_type, std::max<std::size_t>(value.length(), 1));
  H5Tset_strpad(string_type, H5T_STR_NULLTERM);

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto attr_id = H5Acreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT);
  if (attr_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string attribute '{}'", name)));
  }
  AttributeHandle attribute(attr_id);

  if (H5Awrite(attribute, string_type, value.c_str()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string attribute '{}'", name)));
  }
  return {};
}

auto HDF5Writer::write_string_array(hid_t parent, const std::string& name,
                                    const std::vector<std::string>& values) const -> std::expected<void, OutputError> {

  if (values.empty()) {
    return {};
  }

  std::size_t max_len = 0;
  for (const auto& str : values) {
    max_len = std::max(max_len, str.length());
  }
  ++max_len; // For null terminator

  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);

  H5Tset_size(string_type, max_len);
  H5Tset_strpad(string_type, H5T_STR_NULLTERM);

  hsize_t dims = values.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string array '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string array dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  std::vector<char> buffer(values.size() * max_len, '\0');
  for (std::size_t i = 0; i < values.size(); ++i) {
    std::strncpy(&buffer[i * max_len], values[i].c_str(), max_len - 1);
  }

  auto status = H5Dwrite(dataset, string_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data());
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string array data for '{}'", name)));
  }
  return {};
}

auto HDF5Writer::create_chunked_properties(std::size_t size) const -> std::expected<PropertyHandle, OutputError> {

  auto plist_id = H5Pcreate(H5P_DATASET_CREATE);
  if (plist_id < 0) {
    return std::unexpected(OutputError("Failed to create dataset property list"));
  }
  PropertyHandle props(plist_id);

  if (hdf5_config_.compression_level <= 0) {
    return props;
  }

  // Chunk size must be <= data size
  hsize_t chunk_size = std::min(size, hdf5_config_.chunk_size);
  if (chunk_size == 0) {
    chunk_size = 1;
  }

  if (H5Pset_chunk(props, 1, &chunk_size) < 0) {
    return std::unexpected(OutputError("Failed to set chunking"));
  }

  if (hdf5_config_.use_shuffle_filter) {
    H5Pset_shuffle(props);
  }
  H5Pset_deflate(props, static_cast<unsigned>(hdf5_config_.compression_level));

  return props;
}

// HDF5 convenience functions
namespace hdf5 {

auto check_version() -> std::expected<std::string, OutputError> {
  unsigned majnum, minnum, relnum;
  if (H5get_libversion(&majnum, &minnum, &relnum) < 0) {
    return std::unexpected(OutputError("Failed to get HDF5 version"));
  }

  return std::format("{}.{}.{}", majnum, minnum, relnum);
}

auto validate_file(const std::filesystem::path& file_path) -> std::expected<void, OutputError> {

  if (!std::filesystem::exists(file_path)) {
    return std::unexpected(OutputError(std::format("File does not exist: {}", file_path.string())));
  }

  auto result = H5Fis_hdf5(file_path.c_str());
  if (result <= 0) {
    return std::unexpected(OutputError(std::format("Not a valid HDF5 file: {}", file_path.string())));
  }

  return {};
}

namespace {

[[nodiscard]] auto open_read_only(const std::filesystem::path& file_path) -> std::expected<FileHandle, OutputError> {
  ORCKIT_TRY_VOID(validate_file(file_path));
  auto file_id = H5Fopen(file_path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
  if (file_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to open HDF5 file: {}", file_path.string())));
  }
  return FileHandle(file_id);
}

[[nodiscard]] auto read_doubles(const std::filesystem::path& file_path, const std::string& dataset_path)
    -> std::expected<std::vector<double>, OutputError> {
  try {
    auto file_result = open_read_only(file_path);
    if (!file_result) {
      return std::unexpected(file_result.error());
    }
    auto file = std::move(file_result.value());

    auto dataset_id = H5Dopen2(file, dataset_path.c_str(), H5P_DEFAULT);
    if (dataset_id < 0) {
      return std::unexpected(OutputError(std::format("Dataset '{}' not found", dataset_path)));
    }
    DatasetHandle dataset(dataset_id);
    DataspaceHandle space(H5Dget_space(dataset));

    const auto count = H5Sget_simple_extent_npoints(space);
    std::vector<double> values(static_cast<std::size_t>(std::max<hssize_t>(count, 0)));
    if (H5Dread(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data()) < 0) {
      return std::unexpected(OutputError(std::format("Failed to read dataset '{}'", dataset_path)));
    }
    return values;
  } catch (const OutputError& e) {
    return std::unexpected(e);
  }
}

} // namespace

auto read_scalar(const std::filesystem::path& file_path,
                 const std::string& dataset_path) -> std::expected<double, OutputError> {
  std::vector<double> values;
  ORCKIT_TRY_ASSIGN(values, read_doubles(file_path, dataset_path));
  if (values.size() != 1) {
    return std::unexpected(OutputError(std::format("Dataset '{}' is not a scalar", dataset_path)));
  }
  return values.front();
}

auto read_vector(const std::filesystem::path& file_path,
                 const std::string& dataset_path) -> std::expected<std::vector<double>, OutputError> {
  return read_doubles(file_path, dataset_path);
}

auto read_string_attribute(const std::filesystem::path& file_path, const std::string& object_path,
                           const std::string& name) -> std::expected<std::string, OutputError> {
  try {
    auto file_result = open_read_only(file_path);
    if (!file_result) {
      return std::unexpected(file_result.error());
    }
    auto file = std::move(file_result.value());

    auto object_id = H5Oopen(file, object_path.c_str(), H5P_DEFAULT);
    if (object_id < 0) {
      return std::unexpected(OutputError(std::format("Object '{}' not found", object_path)));
    }
    ObjectHandle object(object_id);

    auto attr_id = H5Aopen(object, name.c_str(), H5P_DEFAULT);
    if (attr_id < 0) {
      return std::unexpected(OutputError(std::format("Attribute '{}' not found on '{}'", name, object_path)));
    }
    AttributeHandle attribute(attr_id);
    TypeHandle type(H5Aget_type(attribute));

    std::vector<char> buffer(H5Tget_size(type) + 1, '\0');
    if (H5Aread(attribute, type, buffer.data()) < 0) {
      return std::unexpected(OutputError(std::format("Failed to read attribute '{}'", name)));
    }
    return std::string(buffer.data());
  } catch (const OutputError& e) {
    return std::unexpected(e);
  }
}

} // namespace hdf5

} // namespace orckit::io::output
