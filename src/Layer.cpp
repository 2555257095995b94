// Copyright 2022 Eric Fichter
#include "Layer.h"

Layer::Layer(std::string _id, unsigned int _position, double _thickness) : id(std::move(_id)), position(_position), thickness(_thickness) {}

std::string Layer::ID() const { return id; }

unsigned int Layer::Position() const { return position; }

double Layer::Thickness() const { return thickness; }

Material &Layer::RelMaterial() { return material; }

const Material &Layer::RelMaterial() const { return material; }

double Layer::Resistance() const {

    if (material.thermal_conduc <= 0) {
        std::cerr << "[Warning] Material " << material.Info() << " has no conductivity. Layer " << id << " is skipped." << std::endl;
        return 0;
    }

    return thickness / material.thermal_conduc;
}

void Layer::SetThickness(double _thickness) { thickness = _thickness; }
