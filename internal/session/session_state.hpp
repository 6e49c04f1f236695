#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "internal/store/time_window.hpp"

namespace runlens::session {

enum class SessionField {
  kTimeframe,
  kSortBy,
  kSortDesc,
  kFocusModeActive,
  // guard raised while a focus-mode transition rewrites the timeframe
  kEnteringFocusMode,
  kVolumeLens,
  kActiveFilters,
  kSessionId,
  kImportInProgress,
};

std::string_view SessionFieldName(SessionField field);

struct SessionSnapshot {
  store::TimeWindow      timeframe         = store::kDefaultTimeWindow;
  std::string            sort_by           = "date";
  bool                   sort_desc         = true;
  bool                   focus_mode_active   = false;
  bool                   entering_focus_mode = false;
  std::string            volume_lens         = "quality"; // quality | mix | load | zones
  std::set<std::string>  active_filters;
  std::optional<int64_t> session_id;
  bool                   import_in_progress = false;
};

// Fields left unset are not written.
struct SessionUpdate {
  std::optional<store::TimeWindow>      timeframe;
  std::optional<std::string>            sort_by;
  std::optional<bool>                   sort_desc;
  std::optional<bool>                   focus_mode_active;
  std::optional<bool>                   entering_focus_mode;
  std::optional<std::string>            volume_lens;
  std::optional<std::set<std::string>>  active_filters;
  std::optional<std::optional<int64_t>> session_id;
  std::optional<bool>                   import_in_progress;
};

/*
  Observable per-session view state.

  Every write notifies the subscribers of that field, synchronously and
  in registration order, with a snapshot taken after the write.
  Callbacks run outside the internal lock and may read or write the
  state. A callback that throws is logged; the remaining callbacks
  still run.
*/
class SessionState {
 public:
  using Callback = std::function<void(const SessionSnapshot&)>;
  using Token    = uint64_t;

  SessionState() = default;

  SessionState(const SessionState&)            = delete;
  SessionState& operator=(const SessionState&) = delete;

  SessionSnapshot Snapshot() const;

  Token Subscribe(SessionField field, Callback callback);

  // Unknown tokens are ignored.
  void Unsubscribe(Token token);

  void SetTimeframe(store::TimeWindow timeframe);
  void SetSortBy(std::string column);
  void SetSortDesc(bool desc);
  void SetFocusModeActive(bool active);
  void SetEnteringFocusMode(bool entering);
  // Throws util::InvalidArgument for an unknown lens.
  void SetVolumeLens(std::string lens);
  void SetActiveFilters(std::set<std::string> filters);
  void SetSessionId(std::optional<int64_t> session_id);
  void SetImportInProgress(bool in_progress);

  // Writes every set field, then notifies once per written field.
  void BatchSet(const SessionUpdate& update);

 private:
  struct Subscription {
    Token        token;
    SessionField field;
    Callback     callback;
  };

  void Notify(const std::vector<SessionField>& fields);

  mutable std::mutex        mutex_;
  SessionSnapshot           state_;
  std::vector<Subscription> subscriptions_;
  Token                     next_token_ = 1;
};

} // namespace runlens::session
