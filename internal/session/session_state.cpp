#include "internal/session/session_state.hpp"

#include <algorithm>
#include <array>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace runlens::session {

using runlens::observability::IntField;
using runlens::observability::StringField;

namespace {

constexpr std::array<std::string_view, 4> kVolumeLenses = {"quality", "mix", "load", "zones"};

void CheckVolumeLens(const std::string& lens) {
  if (std::find(kVolumeLenses.begin(), kVolumeLenses.end(), lens) == kVolumeLenses.end()) {
    throw util::InvalidArgument("unknown volume lens: " + lens);
  }
}

} // namespace

std::string_view SessionFieldName(SessionField field) {
  switch (field) {
    case SessionField::kTimeframe:
      return "timeframe";
    case SessionField::kSortBy:
      return "sort_by";
    case SessionField::kSortDesc:
      return "sort_desc";
    case SessionField::kFocusModeActive:
      return "focus_mode_active";
    case SessionField::kEnteringFocusMode:
      return "entering_focus_mode";
    case SessionField::kVolumeLens:
      return "volume_lens";
    case SessionField::kActiveFilters:
      return "active_filters";
    case SessionField::kSessionId:
      return "session_id";
    case SessionField::kImportInProgress:
      return "import_in_progress";
  }
  return "unknown";
}

SessionSnapshot SessionState::Snapshot() const {
  std::lock_guard lock(mutex_);
  return state_;
}

SessionState::Token SessionState::Subscribe(SessionField field, Callback callback) {
  std::lock_guard lock(mutex_);
  Token           token = next_token_++;
  subscriptions_.push_back(Subscription{token, field, std::move(callback)});
  return token;
}

void SessionState::Unsubscribe(Token token) {
  std::lock_guard lock(mutex_);
  subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(), [&](const Subscription& s) { return s.token == token; }),
                       subscriptions_.end());
}

void SessionState::SetTimeframe(store::TimeWindow timeframe) {
  SessionUpdate update;
  update.timeframe = timeframe;
  BatchSet(update);
}

void SessionState::SetSortBy(std::string column) {
  SessionUpdate update;
  update.sort_by = std::move(column);
  BatchSet(update);
}

void SessionState::SetSortDesc(bool desc) {
  SessionUpdate update;
  update.sort_desc = desc;
  BatchSet(update);
}

void SessionState::SetFocusModeActive(bool active) {
  SessionUpdate update;
  update.focus_mode_active = active;
  BatchSet(update);
}

void SessionState::SetEnteringFocusMode(bool entering) {
  SessionUpdate update;
  update.entering_focus_mode = entering;
  BatchSet(update);
}

void SessionState::SetVolumeLens(std::string lens) {
  SessionUpdate update;
  update.volume_lens = std::move(lens);
  BatchSet(update);
}

void SessionState::SetActiveFilters(std::set<std::string> filters) {
  SessionUpdate update;
  update.active_filters = std::move(filters);
  BatchSet(update);
}

void SessionState::SetSessionId(std::optional<int64_t> session_id) {
  SessionUpdate update;
  update.session_id = session_id;
  BatchSet(update);
}

void SessionState::SetImportInProgress(bool in_progress) {
  SessionUpdate update;
  update.import_in_progress = in_progress;
  BatchSet(update);
}

void SessionState::BatchSet(const SessionUpdate& update) {
  if (update.volume_lens) {
    CheckVolumeLens(*update.volume_lens);
  }

  std::vector<SessionField> written;
  {
    std::lock_guard lock(mutex_);
    if (update.timeframe) {
      state_.timeframe = *update.timeframe;
      written.push_back(SessionField::kTimeframe);
    }
    if (update.sort_by) {
      state_.sort_by = *update.sort_by;
      written.push_back(SessionField::kSortBy);
    }
    if (update.sort_desc) {
      state_.sort_desc = *update.sort_desc;
      written.push_back(SessionField::kSortDesc);
    }
    if (update.focus_mode_active) {
      state_.focus_mode_active = *update.focus_mode_active;
      written.push_back(SessionField::kFocusModeActive);
    }
    if (update.entering_focus_mode) {
      state_.entering_focus_mode = *update.entering_focus_mode;
      written.push_back(SessionField::kEnteringFocusMode);
    }
    if (update.volume_lens) {
      state_.volume_lens = *update.volume_lens;
      written.push_back(SessionField::kVolumeLens);
    }
    if (update.active_filters) {
      state_.active_filters = *update.active_filters;
      written.push_back(SessionField::kActiveFilters);
    }
    if (update.session_id) {
      state_.session_id = *update.session_id;
      written.push_back(SessionField::kSessionId);
    }
    if (update.import_in_progress) {
      state_.import_in_progress = *update.import_in_progress;
      written.push_back(SessionField::kImportInProgress);
    }
  }

  Notify(written);
}

void SessionState::Notify(const std::vector<SessionField>& fields) {
  for (auto field : fields) {
    std::vector<Subscription> targets;
    SessionSnapshot           snapshot;
    {
      std::lock_guard lock(mutex_);
      for (const auto& s : subscriptions_) {
        if (s.field == field) targets.push_back(s);
      }
      snapshot = state_;
    }

    for (const auto& target : targets) {
      try {
        target.callback(snapshot);
      } catch (const std::exception& e) {
        RUNLENS_LOG_ERROR("session subscriber failed",
                          {StringField("field", SessionFieldName(field)), IntField("token", static_cast<int64_t>(target.token)),
                           StringField("error", e.what())});
      }
    }
  }
}

} // namespace runlens::session
