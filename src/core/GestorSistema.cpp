#include "GestorSistema.h"
#include "monitoreo/LogMacros.h"

namespace core {

GestorSistema& GestorSistema::instancia() {
    static GestorSistema g; return g;
}

void GestorSistema::registrar(Modulo* m) {
    if (m) modulos_.push_back(m);
}

bool GestorSistema::iniciar() {
    if (iniciado_) return true;
    n_iniciados_ = 0;
    for (auto* m : modulos_) {
        if (!m->iniciar()) {
            LOG_ERROR("CORE", "Fallo iniciando %s", m->nombre());
            // Detener en orden inverso lo que sí arrancó
            for (size_t i = n_iniciados_; i > 0; --i) modulos_[i - 1]->detener();
            n_iniciados_ = 0;
            return false; // aborta si un módulo falla
        }
        LOG_INFO("CORE", "Modulo %s ok", m->nombre());
        n_iniciados_++;
    }
    iniciado_ = true;
    return true;
}

void GestorSistema::loop() {
    if (!iniciado_) return;
    for (auto* m : modulos_) m->actualizar();
}

void GestorSistema::detener() {
    if (!iniciado_) return;
    for (auto it = modulos_.rbegin(); it != modulos_.rend(); ++it) (*it)->detener();
    iniciado_ = false;
    n_iniciados_ = 0;
    LOG_INFO("CORE", "Modulos detenidos");
}

void GestorSistema::limpiar() {
    modulos_.clear();
    n_iniciados_ = 0;
    iniciado_ = false;
}

} // namespace core
