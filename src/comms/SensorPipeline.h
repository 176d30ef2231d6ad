// Canal de último valor: tarea del sensor (Core0) -> motor de sesión (Core1)
#pragma once
#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

struct LecturaSensor {
  uint32_t seq = 0;
  uint32_t t_ms = 0;
  float angulo = 0.0f;      // filtrado, grados
  bool hay_angulo = false;
  float bateria_v = 0.0f;
  bool hay_bateria = false;
  bool conectado = false;
};

namespace SensorPipeline {
  bool init();
  bool publish(const LecturaSensor& l); // sobrescribe la última
  bool latest(LecturaSensor& l);        // no bloquea ni consume
  void dumpStats();
}
