#include "ProtocoloImu.h"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace comms {

static const char PREFIJO_ANG[] = "ANG:";
static const char PREFIJO_VBAT[] = "VBAT:";

// Número completo: el token entero debe ser un float finito
static bool leerNumero(const char* ini, const char* fin, float& out) {
    while (ini < fin && std::isspace((unsigned char)*ini)) ini++;
    while (fin > ini && std::isspace((unsigned char)fin[-1])) fin--;
    if (ini == fin) return false;
    char buf[32];
    size_t n = (size_t)(fin - ini);
    if (n >= sizeof(buf)) return false;
    std::memcpy(buf, ini, n);
    buf[n] = '\0';
    char* resto = nullptr;
    float v = std::strtof(buf, &resto);
    if (resto != buf + n || !std::isfinite(v)) return false;
    out = v;
    return true;
}

LineaImu parsearLinea(const char* linea) {
    LineaImu r;
    if (!linea) return r;
    const char* ini = linea;
    const char* fin = linea + std::strlen(linea);
    while (ini < fin && std::isspace((unsigned char)*ini)) ini++;
    while (fin > ini && std::isspace((unsigned char)fin[-1])) fin--;
    if (ini == fin) return r;

    const size_t n = (size_t)(fin - ini);
    const size_t n_vbat = sizeof(PREFIJO_VBAT) - 1;
    const size_t n_ang = sizeof(PREFIJO_ANG) - 1;
    if (n >= n_vbat && std::strncmp(ini, PREFIJO_VBAT, n_vbat) == 0) {
        if (leerNumero(ini + n_vbat, fin, r.valor)) r.tipo = TipoLinea::BATERIA;
        return r;
    }
    if (n >= n_ang && std::strncmp(ini, PREFIJO_ANG, n_ang) == 0) ini += n_ang;
    if (leerNumero(ini, fin, r.valor)) r.tipo = TipoLinea::ANGULO;
    return r;
}

} // namespace comms
