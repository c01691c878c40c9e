#pragma once

/*
===============================================================================
fluxwire: Public API Entry Point
===============================================================================

Client library for the Flux event/state service: publish events, query
entity state, and subscribe to live entity changes.

Only symbols declared in the fluxwire::core namespace are part of the
public API contract.
===============================================================================
*/

#include <fluxwire/core.hpp>
