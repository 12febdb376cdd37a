//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <Facet/Base/Macros.h>

namespace facet::writer {

//! Base of every scene-graph object the writer can reference.
/*!
 Only the attributes read by the writer are modelled here. A property's
 identity is its address: the writer keys its index tables by
 `const Property*` and never stores indices inside the object.

 @note Properties are owned by the caller's graph and must outlive any
  WriterContext that references them.
*/
class Property {
public:
  Property() = default;
  explicit Property(std::string name)
    : name_(std::move(name))
  {
  }

  virtual ~Property() = default;

  FACET_MAKE_NON_COPYABLE(Property)
  FACET_MAKE_NON_MOVABLE(Property)

  [[nodiscard]] auto Name() const -> const std::string& { return name_; }
  auto SetName(std::string name) -> void { name_ = std::move(name); }

  //! Application-specific data, always a JSON object (empty by default).
  [[nodiscard]] auto Extras() const -> const nlohmann::json& { return extras_; }
  auto SetExtras(nlohmann::json extras) -> void { extras_ = std::move(extras); }

  //! Declared resource URI, empty when the property declares none.
  [[nodiscard]] auto Uri() const -> const std::string& { return uri_; }
  auto SetUri(std::string uri) -> void { uri_ = std::move(uri); }

private:
  std::string name_;
  nlohmann::json extras_ = nlohmann::json::object();
  std::string uri_;
};

class Scene final : public Property {
public:
  using Property::Property;
};

class Node final : public Property {
public:
  using Property::Property;
};

class Mesh final : public Property {
public:
  using Property::Property;
};

class Material final : public Property {
public:
  using Property::Property;
};

class Skin final : public Property {
public:
  using Property::Property;
};

class Camera final : public Property {
public:
  using Property::Property;
};

class Buffer final : public Property {
public:
  using Property::Property;
};

//! Texture image: encoded bytes plus their MIME type.
class Texture final : public Property {
public:
  using Property::Property;

  [[nodiscard]] auto MimeType() const -> const std::string&
  {
    return mime_type_;
  }
  auto SetMimeType(std::string mime_type) -> void
  {
    mime_type_ = std::move(mime_type);
  }

  [[nodiscard]] auto Image() const -> std::span<const std::byte>
  {
    return image_;
  }
  auto SetImage(std::vector<std::byte> image) -> void
  {
    image_ = std::move(image);
  }

private:
  std::string mime_type_;
  std::vector<std::byte> image_;
};

//! Typed view over buffer data, described by element type and count.
class Accessor final : public Property {
public:
  using Property::Property;

  //! Element type, one of `SCALAR`, `VEC2`, `VEC3`, `VEC4`, `MAT2`, `MAT3`,
  //! `MAT4`.
  [[nodiscard]] auto Type() const -> const std::string& { return type_; }
  auto SetType(std::string type) -> void { type_ = std::move(type); }

  //! GL component type enum value (e.g. 5126 for FLOAT).
  [[nodiscard]] auto ComponentType() const -> uint32_t
  {
    return component_type_;
  }
  auto SetComponentType(const uint32_t component_type) -> void
  {
    component_type_ = component_type;
  }

  [[nodiscard]] auto Count() const -> uint32_t { return count_; }
  auto SetCount(const uint32_t count) -> void { count_ = count; }

  [[nodiscard]] auto Min() const -> const std::vector<double>& { return min_; }
  [[nodiscard]] auto Max() const -> const std::vector<double>& { return max_; }
  auto SetBounds(std::vector<double> min, std::vector<double> max) -> void
  {
    min_ = std::move(min);
    max_ = std::move(max);
  }

  [[nodiscard]] auto Normalized() const -> bool { return normalized_; }
  auto SetNormalized(const bool normalized) -> void
  {
    normalized_ = normalized;
  }

private:
  std::string type_ = "SCALAR";
  uint32_t component_type_ = 5126;
  uint32_t count_ = 0;
  std::vector<double> min_;
  std::vector<double> max_;
  bool normalized_ = false;
};

//! Texture filtering and wrapping settings, as GL enum values.
/*!
 A filter value of 0 means "unset" and is omitted from the emitted sampler
 definition.
*/
struct TextureSampler final {
  static constexpr uint32_t kNearest = 9728;
  static constexpr uint32_t kLinear = 9729;
  static constexpr uint32_t kNearestMipmapNearest = 9984;
  static constexpr uint32_t kLinearMipmapNearest = 9985;
  static constexpr uint32_t kNearestMipmapLinear = 9986;
  static constexpr uint32_t kLinearMipmapLinear = 9987;

  static constexpr uint32_t kClampToEdge = 33071;
  static constexpr uint32_t kMirroredRepeat = 33648;
  static constexpr uint32_t kRepeat = 10497;

  uint32_t mag_filter = 0;
  uint32_t min_filter = 0;
  uint32_t wrap_s = kRepeat;
  uint32_t wrap_t = kRepeat;
};

//! Per-slot texture usage settings.
struct TextureInfo final {
  uint32_t tex_coord = 0;
};

} // namespace facet::writer
