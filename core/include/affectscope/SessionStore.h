#pragma once

#include "affectscope/EmotionTypes.h"

#include <sqlite3.h>

#include <mutex>
#include <optional>
#include <string>

namespace affectscope {

// Row counts and headline fields of one persisted session.
struct StoredSessionSummary {
    std::string sessionId;
    std::string profileKey;
    std::string priority;
    bool cancelled{false};
    int detections{0};
    int keptDetections{0};
    int alerts{0};
    int recommendations{0};
    int stageMarkers{0};
    int stageErrors{0};
};

/**
 * SessionStore: SQLite persistence of finished sessions.
 *
 * save_session() writes the whole record in one transaction and rolls back on
 * any failure. Saving the same session id again replaces the previous record.
 * One connection is shared by every caller; each public call holds mutex_
 * for its whole duration, so concurrent sessions may share one store.
 */
class SessionStore {
  public:
    explicit SessionStore(const std::string& path);
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    void initialize();
    void save_session(const SessionResult& result);

    std::optional<StoredSessionSummary> find_session(const std::string& sessionId) const;
    int session_count() const;

  private:
    mutable std::mutex mutex_;
    sqlite3* db_{nullptr};
};

}  // namespace affectscope
