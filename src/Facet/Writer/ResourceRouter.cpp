//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Facet/Writer/ResourceRouter.h>

#include <bit>
#include <utility>

#include <fmt/format.h>

#include <Facet/Base/Logging.h>
#include <Facet/Writer/NativeDocument.h>
#include <Facet/Writer/Property.h>
#include <Facet/Writer/WriterErrors.h>

namespace {

//! Aligns a value up to the alignment boundary.
constexpr auto AlignUp(const uint64_t value, const uint64_t alignment)
  -> uint64_t
{
  const auto remainder = value % alignment;
  return (remainder == 0) ? value : (value + (alignment - remainder));
}

} // namespace

namespace facet::writer {

ResourceRouter::ResourceRouter(
  NativeDocument& document, const WriterOptions& options)
  : document_(document)
  , mode_(options.container_mode)
  , alignment_(options.blob_alignment)
  , generators_ { {
      UniqueUriGenerator(options.MultipleFor(ResourceCategory::kImage),
        options.BasenameFor(ResourceCategory::kImage)),
      UniqueUriGenerator(options.MultipleFor(ResourceCategory::kBuffer),
        options.BasenameFor(ResourceCategory::kBuffer)),
    } }
{
  CHECK_F(std::has_single_bit(options.blob_alignment),
    "blob alignment must be a power of two (got {})", options.blob_alignment);
}

auto ResourceRouter::Place(const std::span<const std::byte> payload,
  const Property& owner, const ResourceCategory category,
  const std::string_view extension) -> ResourcePlacement
{
  if (mode_ == ContainerMode::kEmbedded) {
    return PlaceEmbedded(payload);
  }
  return PlaceExternal(payload, owner, category, extension);
}

auto ResourceRouter::PlaceEmbedded(const std::span<const std::byte> payload)
  -> EmbeddedPlacement
{
  CHECK_F(!resolved_,
    "payload placed after buffer view offsets were resolved; finalize must "
    "run after every object is visited");

  auto& views = document_.Definitions(DefinitionKind::kBufferView);
  const auto view_index = static_cast<uint32_t>(views.size());
  nlohmann::json view = {
    { "buffer", 0 },
    { "byteLength", payload.size() },
  };
  views.push_back(std::move(view));

  blobs_.emplace_back(payload.begin(), payload.end());
  pending_views_.push_back(view_index);

  LOG_F(INFO, "Embed payload #{} (size={}) -> bufferView {}",
    blobs_.size() - 1, payload.size(), view_index);
  return EmbeddedPlacement { .buffer_view = view_index };
}

auto ResourceRouter::PlaceExternal(const std::span<const std::byte> payload,
  const Property& owner, const ResourceCategory category,
  const std::string_view extension) -> ExternalPlacement
{
  auto uri = AllocateName(owner, category, extension);
  ClaimResourceName(uri, owner);
  document_.resources[uri].assign(payload.begin(), payload.end());

  LOG_F(INFO, "Write {} resource '{}' (size={})", to_string(category), uri,
    payload.size());
  return ExternalPlacement { .uri = std::move(uri) };
}

auto ResourceRouter::AllocateName(const Property& owner,
  const ResourceCategory category, const std::string_view extension)
  -> std::string
{
  return generators_.at(static_cast<size_t>(category))
    .CreateUri(owner, extension);
}

auto ResourceRouter::ClaimResourceName(
  const std::string& name, const Property& owner) -> void
{
  const auto [it, inserted] = owner_by_name_.try_emplace(name, &owner);
  if (inserted || it->second == &owner) {
    return;
  }

  const auto& holder = *it->second;
  LOG_F(ERROR, "Resource name '{}' requested by '{}' is already used by '{}'",
    name, owner.Name(), holder.Name());
  throw NamingConflictError(name,
    fmt::format("resource name '{}' requested by '{}' is already used by '{}'",
      name, owner.Name(), holder.Name()));
}

auto ResourceRouter::ResolveOffsets() -> uint64_t
{
  CHECK_F(!resolved_, "buffer view offsets resolved more than once");
  resolved_ = true;

  uint64_t offset = 0;
  if (blobs_.empty()) {
    return offset;
  }

  auto& views = document_.Definitions(DefinitionKind::kBufferView);
  for (size_t i = 0; i < blobs_.size(); ++i) {
    offset = AlignUp(offset, alignment_);
    views.at(pending_views_[i])["byteOffset"] = offset;
    offset += blobs_[i].size();
  }

  DLOG_F(INFO, "Resolved {} embedded buffer views, blob length={}",
    blobs_.size(), offset);
  return offset;
}

} // namespace facet::writer
