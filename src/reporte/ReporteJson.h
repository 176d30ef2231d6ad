/**
 * @file ReporteJson.h
 * @brief Serialización del reporte de sesión a una línea JSON.
 *
 * Formato:
 * {"type":"session_report","reps":[{"n":1,"dir":"TRAS","ang_ext":-21.3,"t_target":1.52},...],
 *  "total_time_s":212.4,"vavg_kmh":4.1,"reps_done":10,"reps_total":10}
 * `t_target` es null cuando la meta no se alcanzó en esa repetición.
 */
#pragma once
#include <cstddef>
#include <string>
#include "control/MotorSesion.h"

namespace reporte {

/**
 * @brief Escribe el reporte en `salida` (reemplaza su contenido).
 * @return Bytes escritos.
 */
size_t serializarReporte(const control::ReporteSesion& r, std::string& salida);

} // namespace reporte
