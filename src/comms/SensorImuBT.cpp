#include "SensorImuBT.h"
#include "comms/ProtocoloImu.h"
#include "comms/SensorPipeline.h"
#include "monitoreo/LogMacros.h"

namespace comms {

bool SensorImuBT::iniciar() {
    if (!SensorPipeline::init()) return false;
    // Modo master: somos quienes inician la conexión hacia el IMU
    if (!bt_.begin(cfg_.nombre_local, true)) {
        LOG_ERROR("IMU", "No se pudo iniciar Bluetooth");
        return false;
    }
    bt_.setTimeout(cfg_.timeout_lectura_ms);
    publicar();

    parar_ = false;
    tarea_activa_ = true;
    BaseType_t r = xTaskCreatePinnedToCore(taskEntry, "IMU_BT_Task", cfg_.stack_tarea, this,
                                           cfg_.prioridad_tarea, &task_handle_, cfg_.core_tarea);
    if (r != pdPASS) {
        LOG_ERROR("IMU", "No se pudo crear tarea IMU");
        tarea_activa_ = false;
        bt_.end();
        return false;
    }
    LOG_INFO("IMU", "Tarea IMU creada (Core%u), buscando %s", (unsigned)cfg_.core_tarea, cfg_.nombre_dispositivo);
    return true;
}

void SensorImuBT::actualizar() {
    EstadoEnlace e = estado_publicado_;
    if (e == ultimo_estado_log_) return;
    if (e == EstadoEnlace::CONECTADO) {
        LOG_INFO("IMU", "Conectado a %s (intentos=%u reconexiones=%u)", cfg_.nombre_dispositivo,
                 (unsigned)reconexion_.intentos(), (unsigned)reconexion_.reconexiones());
    } else if (e == EstadoEnlace::DESCONECTADO && ultimo_estado_log_ == EstadoEnlace::CONECTADO) {
        LOG_WARN("IMU", "Enlace perdido, reintento en %lums", (unsigned long)cfg_.backoff_fallo_ms);
    }
    ultimo_estado_log_ = e;
}

void SensorImuBT::detener() {
    parar_ = true;
    // disconnect() desbloquea la lectura o el connect() en curso; la tarea sale sola
    bt_.disconnect();
    uint32_t t0 = millis();
    while (tarea_activa_ && (millis() - t0) < cfg_.timeout_lectura_ms + 200) delay(10);
    if (tarea_activa_ && task_handle_) {
        LOG_WARN("IMU", "Tarea IMU no terminó tras cerrar el enlace, se elimina");
        vTaskDelete(task_handle_);
        tarea_activa_ = false;
    }
    task_handle_ = nullptr;
    bt_.end();
    LOG_INFO("IMU", "Detenido: intentos=%u fallos=%u lineas_descartadas=%u", (unsigned)reconexion_.intentos(),
             (unsigned)reconexion_.fallos(), (unsigned)descartadas_);
    SensorPipeline::dumpStats();
}

void SensorImuBT::solicitarCero() {
    if (!pedido_cero_.solicitar(estado_publicado_)) {
        LOG_DEBUG("IMU", "Pedido de cero ignorado: enlace %s", nombreEstadoEnlace(estado_publicado_));
    }
}

void SensorImuBT::taskEntry(void* self) {
    static_cast<SensorImuBT*>(self)->taskLoop();
}

bool SensorImuBT::intentarConexion() {
    reconexion_.inicioIntento(millis());
    estado_publicado_ = EstadoEnlace::CONECTANDO;
    LOG_DEBUG("IMU", "Conectando a %s (intento %u)", cfg_.nombre_dispositivo, (unsigned)reconexion_.intentos());
    if (!bt_.connect(cfg_.nombre_dispositivo)) {
        reconexion_.sinDispositivo(millis());
        estado_publicado_ = EstadoEnlace::DESCONECTADO;
        return false;
    }
    reconexion_.conectado(millis());
    pedido_cero_.descartar();
    filtro_.reiniciar();
    estado_publicado_ = EstadoEnlace::CONECTADO;
    publicar();
    return true;
}

void SensorImuBT::cerrarEnlace() {
    if (bt_.connected()) bt_.disconnect();
}

void SensorImuBT::publicar() {
    LecturaSensor l;
    l.seq = ++seq_;
    l.t_ms = millis();
    l.angulo = ultimo_angulo_;
    l.hay_angulo = hay_angulo_;
    l.bateria_v = bateria_v_;
    l.hay_bateria = hay_bateria_;
    l.conectado = estado_publicado_ == EstadoEnlace::CONECTADO;
    SensorPipeline::publish(l);
}

void SensorImuBT::taskLoop() {
    while (!parar_) {
        if (reconexion_.estado() != EstadoEnlace::CONECTADO) {
            if (!reconexion_.puedeIntentar(millis())) {
                vTaskDelay(pdMS_TO_TICKS(50));
                continue;
            }
            if (!intentarConexion()) continue;
        }

        if (!bt_.connected()) {
            reconexion_.fallo(millis());
            estado_publicado_ = EstadoEnlace::DESCONECTADO;
            cerrarEnlace();
            publicar();
            continue;
        }

        if (pedido_cero_.tomar()) {
            bt_.write((uint8_t)cfg_.comando_cero);
            LOG_INFO("IMU", "Pedido de cero enviado al IMU");
        }

        // Bloquea como mucho timeout_lectura_ms; línea vacía = timeout
        String linea = bt_.readStringUntil('\n');
        if (linea.length() == 0) continue;

        LineaImu li = parsearLinea(linea.c_str());
        switch (li.tipo) {
            case TipoLinea::ANGULO:
                ultimo_angulo_ = filtro_.actualizar(li.valor);
                hay_angulo_ = true;
                publicar();
                break;
            case TipoLinea::BATERIA:
                bateria_v_ = li.valor;
                hay_bateria_ = true;
                publicar();
                break;
            default:
                descartadas_++;
                break;
        }
    }
    cerrarEnlace();
    estado_publicado_ = EstadoEnlace::DESCONECTADO;
    tarea_activa_ = false;
    vTaskDelete(nullptr);
}

} // namespace comms
