#pragma once

#include "claimtrax/area.hpp"
#include "claimtrax/closure.hpp"
#include "claimtrax/collision.hpp"
#include "claimtrax/config.hpp"
#include "claimtrax/intersect.hpp"
#include "claimtrax/journal.hpp"
#include "claimtrax/sampler.hpp"
#include "claimtrax/service.hpp"
#include "claimtrax/session.hpp"
#include "claimtrax/speed.hpp"
#include "claimtrax/territory.hpp"
#include "claimtrax/types.hpp"
#include "claimtrax/utils/utils.hpp"
#include "claimtrax/validate.hpp"
