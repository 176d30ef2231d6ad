#include <gtest/gtest.h>
#include <vector>
#include "control/ClasificadorDireccion.h"

using control::ClasificadorDireccion;
using control::Direccion;

TEST(ClasificadorDireccion, HisteresisAdelante) {
    ClasificadorDireccion c(3.0f, 2.0f);
    const std::vector<float> angulos = { 0.0f, 2.5f, 3.5f, 2.5f, 1.5f };
    const std::vector<Direccion> esperado = { Direccion::NEUTRO, Direccion::NEUTRO, Direccion::ADELANTE,
                                              Direccion::ADELANTE, Direccion::NEUTRO };
    for (size_t i = 0; i < angulos.size(); ++i) {
        EXPECT_EQ(c.actualizar(angulos[i]), esperado[i]) << "muestra " << i;
    }
}

TEST(ClasificadorDireccion, HisteresisReversa) {
    ClasificadorDireccion c(3.0f, 2.0f);
    EXPECT_EQ(c.actualizar(-2.9f), Direccion::NEUTRO);
    EXPECT_EQ(c.actualizar(-3.0f), Direccion::REVERSA);
    EXPECT_EQ(c.actualizar(-2.1f), Direccion::REVERSA);
    EXPECT_EQ(c.actualizar(-1.9f), Direccion::NEUTRO);
}

TEST(ClasificadorDireccion, CambioDeSentidoPasaPorNeutro) {
    ClasificadorDireccion c(3.0f, 2.0f);
    c.actualizar(10.0f);
    EXPECT_EQ(c.actualizar(-10.0f), Direccion::NEUTRO);
    EXPECT_EQ(c.actualizar(-10.0f), Direccion::REVERSA);
}

TEST(ClasificadorDireccion, ForzarNeutro) {
    ClasificadorDireccion c(3.0f, 2.0f);
    c.actualizar(5.0f);
    c.forzarNeutro();
    EXPECT_EQ(c.estado(), Direccion::NEUTRO);
    EXPECT_STREQ(control::nombreDireccion(c.estado()), "neutro");
}
