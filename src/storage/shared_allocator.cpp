#include "wid/storage/shared_allocator.h"

#include "wid/id/hlc_generator.h"
#include "wid/id/wid_generator.h"

#include <utility>

namespace wid::storage {

namespace {

constexpr const char* kRetryExhausted = "allocation contention: retry budget exhausted";

// Drives the load / advance / CAS loop for any generator type.
// advance(state) restores the generator to state, renders one id and returns
// the id together with the generator's new state.
template <typename Advance>
AllocationResult allocate_with_cas(IClockStateStore& store, const std::string& key,
                                   const ClockState& initial, const int max_attempts,
                                   Advance&& advance) {
  auto ensured = store.ensure(key, initial);
  if (!ensured.has_value()) {
    return AllocationResult::err(ensured.error());
  }

  for (int attempt = 0; attempt < max_attempts; ++attempt) {
    auto loaded = store.load(key);
    if (!loaded.has_value()) {
      return AllocationResult::err(loaded.error());
    }
    const ClockState expected = loaded.value();

    auto advanced = advance(expected);
    if (!advanced.has_value()) {
      return AllocationResult::err(advanced.error());
    }
    auto& [id, desired] = advanced.value();

    const CasResult cas = store.compare_and_swap(key, expected, desired);
    switch (cas.outcome) {
      case CasOutcome::kSwapped:
        return AllocationResult::ok(std::move(id));
      case CasOutcome::kConflict:
        break;
      case CasOutcome::kBackendError:
        return AllocationResult::err(cas.error_message);
    }
  }
  return AllocationResult::err(kRetryExhausted);
}

using Advanced = core::Result<std::pair<std::string, ClockState>, std::string>;

}  // namespace

std::string to_string(const IdKind kind) {
  switch (kind) {
    case IdKind::kWid:
      return "wid";
    case IdKind::kHlc:
      return "hlc";
  }
  return "wid";
}

std::optional<IdKind> parse_id_kind(const std::string_view text) {
  if (text == "wid") {
    return IdKind::kWid;
  }
  if (text == "hlc") {
    return IdKind::kHlc;
  }
  return std::nullopt;
}

std::string state_key(const IdKind kind, const int w, const std::size_t z,
                      const core::TimeUnit unit) {
  std::string key = "wid:cpp:";
  if (kind == IdKind::kHlc) {
    key += "hlc:";
  }
  key += std::to_string(w) + ":" + std::to_string(z) + ":";
  key += core::to_string(unit);
  return key;
}

AllocationResult allocate_next_wid(IClockStateStore& store, const std::string& key, const int w,
                                   const std::size_t z, const core::TimeUnit unit,
                                   std::shared_ptr<core::ITickClock> clock,
                                   std::shared_ptr<core::IPaddingSource> padding,
                                   const int max_attempts) {
  auto created = id::WidGen::create(w, z, unit, std::move(clock), std::move(padding));
  if (!created.has_value()) {
    return AllocationResult::err(std::string(core::describe(created.error())));
  }
  id::WidGen& gen = created.value();

  const id::WidState fresh;
  return allocate_with_cas(
      store, key, ClockState{fresh.last_tick, fresh.last_seq}, max_attempts,
      [&gen](const ClockState& current) {
        auto restored = gen.restore_state(current.tick, current.counter);
        if (!restored.has_value()) {
          return Advanced::err("stored WID state is invalid: " +
                               std::string(core::describe(restored.error())));
        }
        std::string wid = gen.next();
        const id::WidState next = gen.state();
        return Advanced::ok({std::move(wid), ClockState{next.last_tick, next.last_seq}});
      });
}

AllocationResult allocate_next_hlc_wid(IClockStateStore& store, const std::string& key,
                                       const std::string& node, const int w, const std::size_t z,
                                       const core::TimeUnit unit,
                                       std::shared_ptr<core::ITickClock> clock,
                                       std::shared_ptr<core::IPaddingSource> padding,
                                       const int max_attempts) {
  auto created = id::HlcWidGen::create(node, w, z, unit, std::move(clock), std::move(padding));
  if (!created.has_value()) {
    return AllocationResult::err(std::string(core::describe(created.error())));
  }
  id::HlcWidGen& gen = created.value();

  return allocate_with_cas(
      store, key, ClockState{0, 0}, max_attempts, [&gen](const ClockState& current) {
        auto restored = gen.restore_state(current.tick, current.counter);
        if (!restored.has_value()) {
          return Advanced::err("stored HLC state is invalid: " +
                               std::string(core::describe(restored.error())));
        }
        std::string wid = gen.next();
        const id::HlcState next = gen.state();
        return Advanced::ok({std::move(wid), ClockState{next.pt, next.lc}});
      });
}

}  // namespace wid::storage
