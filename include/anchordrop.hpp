#pragma once

#include "anchordrop/anchor.hpp"
#include "anchordrop/comment.hpp"
#include "anchordrop/config.hpp"
#include "anchordrop/format.hpp"
#include "anchordrop/key.hpp"
#include "anchordrop/ledger.hpp"
#include "anchordrop/lines.hpp"
#include "anchordrop/mutator.hpp"
#include "anchordrop/utils.hpp"
