#include "SmoothSizeIface/IConfigurable.h"
#include "SmoothSizeIface/ISizer.h"

using namespace SmoothSize;

IConfigurable::~IConfigurable() {}
ISizer::~ISizer() {}
