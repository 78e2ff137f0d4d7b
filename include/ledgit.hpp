#pragma once

#include "ledgit/ledgit.hpp"
