// Copyright 2022 Eric Fichter
#ifndef BUILDINGELEMENT_H
#define BUILDINGELEMENT_H

#include "headers.h"
#include "Layer.h"

//! Base of all building elements of a zone.
//! Exchange coefficients are NaN until a type element record was applied.
//! Area, tilt and orientation are set by the archetype, not by the type element record.
class BuildingElement {

public:
    BuildingElement();

    virtual ~BuildingElement() = default;

    //! Returns kind of this element.
    virtual element_category Category() const = 0;

    //! Copies age group, construction type and the exchange coefficients of this kind from the record.
    //! Throws not_found_error if the record lacks a required coefficient. Nothing is changed in that case.
    virtual void SetBasicData(const type_element_record &r);

    //! Returns the database key prefix of a category, e.g. "OuterWall".
    static std::string CategoryName(element_category c);

    //! Returns the database key prefix of this element.
    std::string TypeName() const;

    std::string name;
    double area;
    double tilt;
    double orientation;

    // Type element data
    std::string type_element_key;
    int building_age_min;
    int building_age_max;
    std::string construction_type;
    double inner_radiation;
    double inner_convection;

    //! Returns layers in stacking order.
    const std::list<Layer> &Layers() const;

    //! Appends a layer to the stack.
    Layer &AddLayer(const std::string &id, double thickness);

    //! Removes all layers.
    void ClearLayers();

    //! Returns sum of layer thicknesses.
    double TotalThickness() const;

    //! Returns sum of conductive resistances of layers in m2K/W.
    double ConductiveResistance() const;

    //! Returns true if a type element record was applied.
    bool HasTypeData() const;

    //! Print attributes.
    void Log() const;

    //! String with basic info.
    std::string Info() const;

protected:
    //! Returns v or throws not_found_error naming the coefficient, if v is NaN.
    static double required(double v, const std::string &coefficient, const type_element_record &r);

private:
    std::list<Layer> layers;
};

//! Element between zone and ambient air. Uses inner and outer exchange coefficients.
class OpaqueElement : public BuildingElement {

public:
    void SetBasicData(const type_element_record &r) override;

    double outer_radiation;
    double outer_convection;

protected:
    OpaqueElement();
};

class OuterWall : public OpaqueElement {
public:
    element_category Category() const override { return OUTER_WALL; }
};

class Rooftop : public OpaqueElement {
public:
    element_category Category() const override { return ROOFTOP; }
};

class Door : public OpaqueElement {
public:
    element_category Category() const override { return DOOR; }
};

//! Transparent element with solar gain and shading parameters.
class Window : public BuildingElement {

public:
    Window();

    element_category Category() const override { return WINDOW; }

    void SetBasicData(const type_element_record &r) override;

    double outer_radiation;
    double outer_convection;
    double g_value;
    double a_conv;
    double shading_g_total;
    double shading_max_irr;
};

class InnerWall : public BuildingElement {
public:
    element_category Category() const override { return INNER_WALL; }
};

class GroundFloor : public BuildingElement {
public:
    element_category Category() const override { return GROUND_FLOOR; }
};

class Ceiling : public BuildingElement {
public:
    element_category Category() const override { return CEILING; }
};

class Floor : public BuildingElement {
public:
    element_category Category() const override { return FLOOR; }
};

#endif //BUILDINGELEMENT_H
