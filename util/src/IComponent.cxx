#include "SmoothSizeUtil/IComponent.h"

SmoothSize::Interface::~Interface() {}
