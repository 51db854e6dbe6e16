#pragma once
#include "dataspec/attribute/Attribute.hpp"
#include "dataspec/attribute/AttributeFactory.hpp"
#include "dataspec/attribute/AttributeList.hpp"
#include "dataspec/attribute/AttributeType.hpp"
#include "dataspec/attribute/FloatValue.hpp"
#include "dataspec/core/BuildOptions.hpp"
#include "dataspec/core/Error.hpp"
#include "dataspec/dag/SimpleDag.hpp"
#include "dataspec/element/Element.hpp"
#include "dataspec/element/ElementSet.hpp"
#include "dataspec/operation/IOCollection.hpp"
#include "dataspec/operation/InputOutputSpec.hpp"
#include "dataspec/operation/NamedIOEntry.hpp"
#include "dataspec/operation/Operation.hpp"
