#include "ConfigPerfil.h"

namespace config {

ConfigPerfil cargarConfigDefault() {
    ConfigPerfil p;
    // TODO: leer sintonía por paciente desde NVS (reps, metas, tiempos) cuando exista la pantalla de ajustes.
    return p;
}

} // namespace config
