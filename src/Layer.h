// Copyright 2022 Eric Fichter
#ifndef LAYER_H
#define LAYER_H

#include "headers.h"
#include "Material.h"

//! Describes a material layer of a building element.
//! The layer owns its material, layers sharing a material id are independent copies.
//! Position 0 is the first layer of the stack, the stacking order is defined by the element.
class Layer {

public:
    //! Constructor setting all member variables except the material.
    Layer(std::string _id, unsigned int _position, double _thickness);

    //! Returns id of the layer in its type element record.
    std::string ID() const;

    //! Returns position within the layer stack.
    unsigned int Position() const;

    //! Returns thickness.
    double Thickness() const;

    //! Returns material.
    Material &RelMaterial();

    //! Returns material.
    const Material &RelMaterial() const;

    //! Returns conductive resistance thickness / conductivity.
    double Resistance() const;

    //! Sets thickness.
    void SetThickness(double _thickness);

private:
    //! Id of the layer definition it was created from.
    std::string id;

    //! Position within the stack of the element.
    unsigned int position;

    //! Thickness in m.
    double thickness;

    //! Material exclusively owned by this layer.
    Material material;
};

#endif //LAYER_H
