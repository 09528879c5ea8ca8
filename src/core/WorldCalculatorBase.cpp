#include "WorldCalculatorBase.h"
#include "Body.h"

using namespace BouncePit;

double WorldCalculatorBase::effectiveInverseMass(const Body& body)
{
    return body.kinematic ? 0.0 : body.inv_mass;
}
