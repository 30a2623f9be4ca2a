
#pragma once

#include "Descriptor.hpp"
#include "Errors.hpp"
#include "Serializable.hpp"
#include "Serializer.hpp"
#include "TypeDescriptor.hpp"
#include "Xml.hpp"
