#include "affectscope/ReportWriter.h"

#include "affectscope/ContextClassifier.h"
#include "affectscope/CoreContract.h"
#include "affectscope/Utility.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>
#include <glog/logging.h>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace affectscope {

namespace {

const std::string kRule(80, '=');
const std::string kSubRule(40, '-');

std::string date_stamp(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y%m%d", &tm);
    return std::string(buf, n);
}

void section(std::ostream& out, const char* title) {
    out << "\n" << title << "\n" << kSubRule << "\n";
}

}  // namespace

void write_text_report(std::ostream& out, const SessionResult& s) {
    out << kRule << "\n";
    out << "REPORTE DE ANÁLISIS EMOCIONAL MULTIMODAL\n";
    out << kRule << "\n";

    section(out, "INFORMACIÓN DE LA SESIÓN");
    out << "Sesión: " << s.sessionId << "\n";
    out << "Video: " << s.videoPath << "\n";
    out << "Inicio: " << format_timestamp(s.startedAt) << "\n";
    out << "Diagnóstico: " << (s.config.diagnosis.empty() ? "(no indicado)" : s.config.diagnosis) << "\n";
    out << "Perfil: " << s.config.profile.key << "\n";
    out << "Intervalo de muestreo: " << s.config.profile.frameIntervalMs << " ms\n";
    out << "Umbral de confianza: " << absl::StrFormat("%.2f", s.config.profile.confidenceThreshold) << "\n";
    out << "Versión de contrato: " << contract::CORE_CONTRACT_VERSION << "\n";
    if (s.cancelled) {
        out << "Análisis interrumpido: resultados parciales\n";
    }

    if (s.participant.ageMonths || !s.participant.notes.empty()) {
        section(out, "INFORMACIÓN DEL PARTICIPANTE");
        if (s.participant.ageMonths) out << "Edad (meses): " << *s.participant.ageMonths << "\n";
        if (!s.participant.notes.empty()) out << "Notas: " << s.participant.notes << "\n";
    }

    section(out, "ANÁLISIS FACIAL");
    out << "Frames analizados: " << s.statistics.framesAnalyzed << "\n";
    out << "Frames con rostros sobre el umbral: " << s.statistics.framesWithFaces << "\n";
    out << "Detecciones descartadas por confianza: " << s.statistics.droppedDetections << "\n";
    for (const auto& frame : s.rawFrames) {
        out << "Frame " << frame.frameId << " (" << absl::StrFormat("%.2f", frame.timestampSeconds)
            << " s) - Rostros: " << frame.faces.size() << "\n";
        for (const auto& face : frame.faces) {
            out << "   Emoción: " << emotion_to_string(face.label) << " (Confianza: "
                << absl::StrFormat("%.2f", face.confidence) << ")" << (face.fromFallback ? " [heurística]" : "")
                << "\n";
        }
    }

    section(out, "DISTRIBUCIÓN DE EMOCIONES");
    for (Emotion e : kAllEmotions) {
        const int n = s.statistics.counts[emotion_index(e)];
        if (n == 0) continue;
        const auto& c = s.statistics.confidence[emotion_index(e)];
        out << emotion_to_string(e) << ": " << n << " ("
            << absl::StrFormat("%.1f%%", 100.0 * n / std::max(1, s.statistics.totalDetections))
            << "), confianza media " << absl::StrFormat("%.2f", c.mean) << "\n";
    }
    if (s.statistics.predominant) {
        out << "Emoción predominante: " << emotion_to_string(*s.statistics.predominant) << " ("
            << absl::StrFormat("%.1f%%", 100.0 * s.statistics.predominantShare) << ")\n";
    } else {
        out << "Sin detecciones sobre el umbral\n";
    }

    section(out, "TRANSCRIPCIÓN DE AUDIO Y PALABRAS");
    if (!s.audioAvailable) {
        out << "Audio no disponible\n";
    } else {
        out << "Transcripción: " << s.audio.transcript << "\n";
        out << "Palabras detectadas: " << absl::StrJoin(s.audio.words, ", ") << "\n";
        out << "Intentos de palabra: " << s.audio.attempts << "\n";
        out << "Nivel comunicativo: "
            << communication_level_to_string(classify_communication_level(s.audio.attempts, s.audio.wordCount))
            << "\n";
        out << "Claridad: " << clarity_to_string(s.audio.quality) << "\n";
    }

    section(out, "ALERTAS");
    if (s.alerts.empty()) out << "Sin alertas\n";
    for (const auto& a : s.alerts) {
        out << "[" << alert_type_to_string(a.type) << "/" << alert_level_to_string(a.level) << "] " << a.message
            << "\n   " << a.recommendation << "\n";
    }
    out << "Prioridad: " << priority_to_string(s.priority) << "\n";

    section(out, "RECOMENDACIONES");
    for (const auto& r : s.recommendations) {
        out << "- " << r << "\n";
    }

    if (!s.errors.empty()) {
        section(out, "ERRORES");
        for (const auto& e : s.errors) {
            out << "- " << e << "\n";
        }
    }
    out << "\n" << kRule << "\n";
}

void write_csv_export(std::ostream& out, const SessionResult& s) {
    out << "frame_id,tiempo_segundos,emocion,confianza,face_id\n";
    for (const auto& frame : s.rawFrames) {
        for (std::size_t i = 0; i < frame.faces.size(); ++i) {
            const auto& face = frame.faces[i];
            out << frame.frameId << "," << absl::StrFormat("%.3f", frame.timestampSeconds) << ","
                << emotion_to_string(face.label) << "," << absl::StrFormat("%.4f", face.confidence) << "," << i
                << "\n";
        }
    }
}

ReportWriter::ReportWriter(std::string outputDir) : outputDir_(std::move(outputDir)) {
    std::error_code ec;
    std::filesystem::create_directories(outputDir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + outputDir_ + ": " + ec.message());
    }
}

absl::StatusOr<ReportArtifacts> ReportWriter::write(const SessionResult& session) const {
    const auto dir = std::filesystem::path(outputDir_) / ("informes_" + date_stamp(session.startedAt));
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return absl::InternalError(absl::StrCat("Cannot create report directory ", dir.string(), ": ", ec.message()));
    }

    ReportArtifacts artifacts;
    artifacts.textReportPath = (dir / ("reporte_" + session.sessionId + ".txt")).string();
    artifacts.csvPath = (dir / ("datos_" + session.sessionId + ".csv")).string();

    {
        std::ofstream out(artifacts.textReportPath);
        if (!out) return absl::InternalError("Cannot write " + artifacts.textReportPath);
        write_text_report(out, session);
        if (!out) return absl::InternalError("Write failed for " + artifacts.textReportPath);
    }
    {
        std::ofstream out(artifacts.csvPath);
        if (!out) return absl::InternalError("Cannot write " + artifacts.csvPath);
        write_csv_export(out, session);
        if (!out) return absl::InternalError("Write failed for " + artifacts.csvPath);
    }

    LOG(INFO) << "Report written to " << artifacts.textReportPath;
    return artifacts;
}

}  // namespace affectscope
