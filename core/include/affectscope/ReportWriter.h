#pragma once

#include "affectscope/EmotionTypes.h"

#include <absl/status/statusor.h>

#include <ostream>
#include <string>

namespace affectscope {

/**
 * ReportWriter: per-session text report and CSV export.
 *
 * Files land in <outputDir>/informes_<YYYYMMDD>/ (session start date):
 *   reporte_<session>.txt
 *   datos_<session>.csv   frame_id,tiempo_segundos,emocion,confianza,face_id
 *
 * The constructor creates outputDir and throws std::runtime_error when it
 * cannot; per-session write failures come back as a status.
 */
class ReportWriter {
  public:
    explicit ReportWriter(std::string outputDir);

    absl::StatusOr<ReportArtifacts> write(const SessionResult& session) const;

    const std::string& output_dir() const { return outputDir_; }

  private:
    std::string outputDir_;
};

void write_text_report(std::ostream& out, const SessionResult& session);
void write_csv_export(std::ostream& out, const SessionResult& session);

}  // namespace affectscope
