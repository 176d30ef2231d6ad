#include "ReporteJson.h"
#include <ArduinoJson.h>

namespace reporte {

size_t serializarReporte(const control::ReporteSesion& r, std::string& salida) {
    JsonDocument doc;
    doc["type"] = "session_report";
    JsonArray reps = doc["reps"].to<JsonArray>();
    unsigned n = 1;
    for (const auto& rep : r.reps) {
        JsonObject o = reps.add<JsonObject>();
        o["n"] = n++;
        o["dir"] = control::nombreFase(rep.direccion);
        o["ang_ext"] = rep.extremo_deg;
        if (rep.tiene_t_meta) o["t_target"] = rep.t_meta_s;
        else o["t_target"] = nullptr;
    }
    doc["total_time_s"] = r.t_total_s;
    doc["vavg_kmh"] = r.vmedia_kmh;
    doc["reps_done"] = r.reps_hechas;
    doc["reps_total"] = r.reps_totales;

    salida.clear();
    return serializeJson(doc, salida);
}

} // namespace reporte
