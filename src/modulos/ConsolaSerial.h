/**
 * @file ConsolaSerial.h
 * @brief Lee teclas del puerto USB y las entrega como comandos de sesión.
 */
#pragma once
#include <Arduino.h>
#include <functional>
#include "core/Modulo.h"
#include "config/ConfigPerfil.h"
#include "control/Comandos.h"

namespace modulos {

using ComandoCallback = std::function<void(control::Comando)>;

class ConsolaSerial : public core::Modulo {
public:
    explicit ConsolaSerial(const config::ConsolaConfig& cfg) : cfg_(cfg) {}

    const char* nombre() const override { return "CONSOLA"; }
    void actualizar() override;

    void setCallback(ComandoCallback cb) { callback_ = cb; }

private:
    config::ConsolaConfig cfg_;
    ComandoCallback callback_{};
};

} // namespace modulos
