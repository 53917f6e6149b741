#include "affectscope/SessionStore.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <absl/strings/str_join.h>
#include <glog/logging.h>

#include "affectscope/CoreContract.h"
#include "affectscope/Utility.h"

namespace affectscope {

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

void exec_or_throw(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "Unknown sqlite error";
        sqlite3_free(err);
        throw std::runtime_error(message);
    }
}

StatementPtr prepare_or_throw(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }
    return StatementPtr(stmt, &sqlite3_finalize);
}

void step_done_or_throw(sqlite3* db, sqlite3_stmt* stmt) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }
    sqlite3_reset(stmt);
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

void delete_children(sqlite3* db, int64_t sessionKey) {
    static const char* kTables[] = {"detections", "emotion_stats", "audio", "audio_segments", "alerts",
                                    "recommendations", "stage_markers", "stage_errors"};
    for (const char* table : kTables) {
        auto stmt = prepare_or_throw(db, std::string("DELETE FROM ") + table + " WHERE session_fk=?;");
        sqlite3_bind_int64(stmt.get(), 1, sessionKey);
        step_done_or_throw(db, stmt.get());
    }
}

void insert_string_list(sqlite3* db, const char* table, const char* column, int64_t sessionKey,
                        const std::vector<std::string>& values) {
    auto stmt = prepare_or_throw(
        db, std::string("INSERT INTO ") + table + " (session_fk, position, " + column + ") VALUES (?,?,?);");
    int position = 0;
    for (const auto& value : values) {
        sqlite3_bind_int64(stmt.get(), 1, sessionKey);
        sqlite3_bind_int(stmt.get(), 2, position++);
        bind_text(stmt.get(), 3, value);
        step_done_or_throw(db, stmt.get());
    }
}

int count_rows(sqlite3* db, const char* table, int64_t sessionKey, const char* extraWhere = nullptr) {
    std::string sql = std::string("SELECT COUNT(*) FROM ") + table + " WHERE session_fk=?";
    if (extraWhere) sql += std::string(" AND ") + extraWhere;
    auto stmt = prepare_or_throw(db, sql + ";");
    sqlite3_bind_int64(stmt.get(), 1, sessionKey);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }
    return sqlite3_column_int(stmt.get(), 0);
}

}  // namespace

SessionStore::SessionStore(const std::string& path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite database at " + path + ": " + message);
    }
}

SessionStore::~SessionStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SessionStore::initialize() {
    std::scoped_lock lock(mutex_);
    const char* schema = R"SQL(
        PRAGMA journal_mode=WAL;
        PRAGMA foreign_keys=ON;

        CREATE TABLE IF NOT EXISTS sessions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL UNIQUE,
            video_path TEXT NOT NULL,
            diagnosis TEXT,
            profile_key TEXT NOT NULL,
            frame_interval_ms INTEGER NOT NULL,
            confidence_threshold REAL NOT NULL,
            max_frames INTEGER NOT NULL DEFAULT 0,
            age_months INTEGER,
            participant_notes TEXT,
            priority TEXT NOT NULL,
            cancelled INTEGER NOT NULL DEFAULT 0,
            audio_available INTEGER NOT NULL DEFAULT 0,
            frames_analyzed INTEGER NOT NULL DEFAULT 0,
            total_detections INTEGER NOT NULL DEFAULT 0,
            dropped_detections INTEGER NOT NULL DEFAULT 0,
            predominant_emotion TEXT,
            predominant_share REAL,
            report_path TEXT,
            csv_path TEXT,
            contract_version TEXT NOT NULL,
            started_at_ms INTEGER NOT NULL,
            finished_at_ms INTEGER NOT NULL,
            created_at TEXT DEFAULT CURRENT_TIMESTAMP
        );

        CREATE INDEX IF NOT EXISTS idx_sessions_started ON sessions(started_at_ms);

        -- One row per scored face; kept=0 rows were removed by the confidence threshold
        CREATE TABLE IF NOT EXISTS detections (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_fk INTEGER NOT NULL,
            frame_id INTEGER NOT NULL,
            timestamp_sec REAL NOT NULL,
            face_index INTEGER NOT NULL,
            box_x INTEGER NOT NULL,
            box_y INTEGER NOT NULL,
            box_w INTEGER NOT NULL,
            box_h INTEGER NOT NULL,
            emotion TEXT NOT NULL,
            confidence REAL NOT NULL,
            quality REAL NOT NULL,
            from_fallback INTEGER NOT NULL,
            kept INTEGER NOT NULL,
            probs_blob BLOB NOT NULL,
            FOREIGN KEY(session_fk) REFERENCES sessions(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_detections_session ON detections(session_fk, frame_id);

        CREATE TABLE IF NOT EXISTS emotion_stats (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_fk INTEGER NOT NULL,
            emotion TEXT NOT NULL,
            count INTEGER NOT NULL,
            conf_mean REAL NOT NULL,
            conf_median REAL NOT NULL,
            conf_std REAL NOT NULL,
            conf_min REAL NOT NULL,
            conf_max REAL NOT NULL,
            FOREIGN KEY(session_fk) REFERENCES sessions(id) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS audio (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_fk INTEGER NOT NULL UNIQUE,
            language TEXT,
            transcript TEXT,
            words TEXT,
            word_count INTEGER NOT NULL,
            attempts INTEGER NOT NULL,
            quality TEXT NOT NULL,
            FOREIGN KEY(session_fk) REFERENCES sessions(id) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS audio_segments (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_fk INTEGER NOT NULL,
            position INTEGER NOT NULL,
            start_sec REAL NOT NULL,
            end_sec REAL NOT NULL,
            transcript TEXT,
            word_count INTEGER NOT NULL,
            attempts INTEGER NOT NULL,
            quality TEXT NOT NULL,
            FOREIGN KEY(session_fk) REFERENCES sessions(id) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS alerts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_fk INTEGER NOT NULL,
            type TEXT NOT NULL,
            level TEXT NOT NULL,
            message TEXT NOT NULL,
            recommendation TEXT,
            created_at_ms INTEGER NOT NULL,
            FOREIGN KEY(session_fk) REFERENCES sessions(id) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS recommendations (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_fk INTEGER NOT NULL,
            position INTEGER NOT NULL,
            text TEXT NOT NULL,
            FOREIGN KEY(session_fk) REFERENCES sessions(id) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS stage_markers (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_fk INTEGER NOT NULL,
            position INTEGER NOT NULL,
            stage TEXT NOT NULL,
            FOREIGN KEY(session_fk) REFERENCES sessions(id) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS stage_errors (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_fk INTEGER NOT NULL,
            position INTEGER NOT NULL,
            message TEXT NOT NULL,
            FOREIGN KEY(session_fk) REFERENCES sessions(id) ON DELETE CASCADE
        );
    )SQL";

    exec_or_throw(db_, schema);
}

void SessionStore::save_session(const SessionResult& result) {
    std::scoped_lock lock(mutex_);
    exec_or_throw(db_, "BEGIN TRANSACTION;");
    try {
        // Upsert on the logical session id
        int64_t sessionKey = -1;
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO sessions (session_id, video_path, diagnosis, profile_key, frame_interval_ms, "
                "confidence_threshold, max_frames, age_months, participant_notes, priority, cancelled, "
                "audio_available, frames_analyzed, total_detections, dropped_detections, predominant_emotion, "
                "predominant_share, report_path, csv_path, contract_version, started_at_ms, finished_at_ms) "
                "VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
                "ON CONFLICT(session_id) DO UPDATE SET "
                "video_path=excluded.video_path, diagnosis=excluded.diagnosis, profile_key=excluded.profile_key, "
                "frame_interval_ms=excluded.frame_interval_ms, confidence_threshold=excluded.confidence_threshold, "
                "max_frames=excluded.max_frames, age_months=excluded.age_months, "
                "participant_notes=excluded.participant_notes, priority=excluded.priority, "
                "cancelled=excluded.cancelled, audio_available=excluded.audio_available, "
                "frames_analyzed=excluded.frames_analyzed, total_detections=excluded.total_detections, "
                "dropped_detections=excluded.dropped_detections, predominant_emotion=excluded.predominant_emotion, "
                "predominant_share=excluded.predominant_share, report_path=excluded.report_path, "
                "csv_path=excluded.csv_path, contract_version=excluded.contract_version, "
                "started_at_ms=excluded.started_at_ms, finished_at_ms=excluded.finished_at_ms "
                "RETURNING id;");

            const auto& stats = result.statistics;
            sqlite3_stmt* s = stmt.get();
            bind_text(s, 1, result.sessionId);
            bind_text(s, 2, result.videoPath);
            bind_text(s, 3, result.config.diagnosis);
            bind_text(s, 4, result.config.profile.key);
            sqlite3_bind_int(s, 5, result.config.profile.frameIntervalMs);
            sqlite3_bind_double(s, 6, result.config.profile.confidenceThreshold);
            sqlite3_bind_int(s, 7, result.config.maxFrames);
            if (result.participant.ageMonths) {
                sqlite3_bind_int(s, 8, *result.participant.ageMonths);
            } else {
                sqlite3_bind_null(s, 8);
            }
            bind_text(s, 9, result.participant.notes);
            bind_text(s, 10, priority_to_string(result.priority));
            sqlite3_bind_int(s, 11, result.cancelled ? 1 : 0);
            sqlite3_bind_int(s, 12, result.audioAvailable ? 1 : 0);
            sqlite3_bind_int(s, 13, stats.framesAnalyzed);
            sqlite3_bind_int(s, 14, stats.totalDetections);
            sqlite3_bind_int(s, 15, stats.droppedDetections);
            if (stats.predominant) {
                bind_text(s, 16, emotion_to_string(*stats.predominant));
                sqlite3_bind_double(s, 17, stats.predominantShare);
            } else {
                sqlite3_bind_null(s, 16);
                sqlite3_bind_null(s, 17);
            }
            bind_text(s, 18, result.reports.textReportPath);
            bind_text(s, 19, result.reports.csvPath);
            sqlite3_bind_text(s, 20, contract::CORE_CONTRACT_VERSION, -1, SQLITE_STATIC);
            sqlite3_bind_int64(s, 21, to_epoch_ms(result.startedAt));
            sqlite3_bind_int64(s, 22, to_epoch_ms(result.finishedAt));

            if (sqlite3_step(s) == SQLITE_ROW) {
                sessionKey = sqlite3_column_int64(s, 0);
            }
        }

        if (sessionKey < 0) {
            throw std::runtime_error("Failed to insert/get session row for " + result.sessionId);
        }

        delete_children(db_, sessionKey);

        // Detections with their full distribution as a float BLOB
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO detections (session_fk, frame_id, timestamp_sec, face_index, box_x, box_y, box_w, "
                "box_h, emotion, confidence, quality, from_fallback, kept, probs_blob) "
                "VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
            const double threshold = result.config.profile.confidenceThreshold;
            sqlite3_stmt* s = stmt.get();

            for (const auto& frame : result.rawFrames) {
                int faceIndex = 0;
                for (const auto& face : frame.faces) {
                    std::vector<float> probs(face.distribution.begin(), face.distribution.end());
                    sqlite3_bind_int64(s, 1, sessionKey);
                    sqlite3_bind_int64(s, 2, frame.frameId);
                    sqlite3_bind_double(s, 3, frame.timestampSeconds);
                    sqlite3_bind_int(s, 4, faceIndex++);
                    sqlite3_bind_int(s, 5, face.box.x);
                    sqlite3_bind_int(s, 6, face.box.y);
                    sqlite3_bind_int(s, 7, face.box.width);
                    sqlite3_bind_int(s, 8, face.box.height);
                    bind_text(s, 9, emotion_to_string(face.label));
                    sqlite3_bind_double(s, 10, face.confidence);
                    sqlite3_bind_double(s, 11, face.quality);
                    sqlite3_bind_int(s, 12, face.fromFallback ? 1 : 0);
                    sqlite3_bind_int(s, 13, face.confidence >= threshold ? 1 : 0);
                    sqlite3_bind_blob(s, 14, probs.data(), static_cast<int>(probs.size() * sizeof(float)),
                                      SQLITE_TRANSIENT);
                    step_done_or_throw(db_, s);
                }
            }
        }

        // Per-emotion statistics
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO emotion_stats (session_fk, emotion, count, conf_mean, conf_median, conf_std, "
                "conf_min, conf_max) VALUES (?,?,?,?,?,?,?,?);");
            sqlite3_stmt* s = stmt.get();
            for (Emotion e : kAllEmotions) {
                const std::size_t idx = emotion_index(e);
                const auto& c = result.statistics.confidence[idx];
                sqlite3_bind_int64(s, 1, sessionKey);
                bind_text(s, 2, emotion_to_string(e));
                sqlite3_bind_int(s, 3, result.statistics.counts[idx]);
                sqlite3_bind_double(s, 4, c.mean);
                sqlite3_bind_double(s, 5, c.median);
                sqlite3_bind_double(s, 6, c.stddev);
                sqlite3_bind_double(s, 7, c.min);
                sqlite3_bind_double(s, 8, c.max);
                step_done_or_throw(db_, s);
            }
        }

        if (result.audioAvailable) {
            {
                auto stmt = prepare_or_throw(db_,
                    "INSERT INTO audio (session_fk, language, transcript, words, word_count, attempts, quality) "
                    "VALUES (?,?,?,?,?,?,?);");
                sqlite3_stmt* s = stmt.get();
                sqlite3_bind_int64(s, 1, sessionKey);
                bind_text(s, 2, result.audio.languageCode);
                bind_text(s, 3, result.audio.transcript);
                bind_text(s, 4, absl::StrJoin(result.audio.words, " "));
                sqlite3_bind_int(s, 5, result.audio.wordCount);
                sqlite3_bind_int(s, 6, result.audio.attempts);
                bind_text(s, 7, clarity_to_string(result.audio.quality));
                step_done_or_throw(db_, s);
            }
            {
                auto stmt = prepare_or_throw(db_,
                    "INSERT INTO audio_segments (session_fk, position, start_sec, end_sec, transcript, word_count, "
                    "attempts, quality) VALUES (?,?,?,?,?,?,?,?);");
                sqlite3_stmt* s = stmt.get();
                int position = 0;
                for (const auto& seg : result.audio.segments) {
                    sqlite3_bind_int64(s, 1, sessionKey);
                    sqlite3_bind_int(s, 2, position++);
                    sqlite3_bind_double(s, 3, seg.startSeconds);
                    sqlite3_bind_double(s, 4, seg.endSeconds);
                    bind_text(s, 5, seg.transcript);
                    sqlite3_bind_int(s, 6, seg.wordCount);
                    sqlite3_bind_int(s, 7, seg.attempts);
                    bind_text(s, 8, clarity_to_string(seg.quality));
                    step_done_or_throw(db_, s);
                }
            }
        }

        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO alerts (session_fk, type, level, message, recommendation, created_at_ms) "
                "VALUES (?,?,?,?,?,?);");
            sqlite3_stmt* s = stmt.get();
            for (const auto& alert : result.alerts) {
                sqlite3_bind_int64(s, 1, sessionKey);
                bind_text(s, 2, alert_type_to_string(alert.type));
                bind_text(s, 3, alert_level_to_string(alert.level));
                bind_text(s, 4, alert.message);
                bind_text(s, 5, alert.recommendation);
                sqlite3_bind_int64(s, 6, to_epoch_ms(alert.timestamp));
                step_done_or_throw(db_, s);
            }
        }

        insert_string_list(db_, "recommendations", "text", sessionKey, result.recommendations);
        insert_string_list(db_, "stage_markers", "stage", sessionKey, result.completedStages);
        insert_string_list(db_, "stage_errors", "message", sessionKey, result.errors);

        exec_or_throw(db_, "COMMIT;");
    } catch (...) {
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            LOG(ERROR) << "Rollback of session " << result.sessionId << " failed: " << (err ? err : "unknown error");
            sqlite3_free(err);
        }
        throw;
    }
    VLOG(1) << "Persisted session " << result.sessionId;
}

std::optional<StoredSessionSummary> SessionStore::find_session(const std::string& sessionId) const {
    std::scoped_lock lock(mutex_);
    auto stmt = prepare_or_throw(db_, "SELECT id, profile_key, priority, cancelled FROM sessions WHERE session_id=?;");
    bind_text(stmt.get(), 1, sessionId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    StoredSessionSummary summary;
    summary.sessionId = sessionId;
    const int64_t key = sqlite3_column_int64(stmt.get(), 0);
    const unsigned char* profile = sqlite3_column_text(stmt.get(), 1);
    const unsigned char* priority = sqlite3_column_text(stmt.get(), 2);
    summary.profileKey = profile ? reinterpret_cast<const char*>(profile) : "";
    summary.priority = priority ? reinterpret_cast<const char*>(priority) : "";
    summary.cancelled = sqlite3_column_int(stmt.get(), 3) != 0;

    summary.detections = count_rows(db_, "detections", key);
    summary.keptDetections = count_rows(db_, "detections", key, "kept=1");
    summary.alerts = count_rows(db_, "alerts", key);
    summary.recommendations = count_rows(db_, "recommendations", key);
    summary.stageMarkers = count_rows(db_, "stage_markers", key);
    summary.stageErrors = count_rows(db_, "stage_errors", key);
    return summary;
}

int SessionStore::session_count() const {
    std::scoped_lock lock(mutex_);
    auto stmt = prepare_or_throw(db_, "SELECT COUNT(*) FROM sessions;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw std::runtime_error(sqlite3_errmsg(db_));
    }
    return sqlite3_column_int(stmt.get(), 0);
}

}  // namespace affectscope
