#pragma once

#include "blobfig/dtype.hpp"
#include "blobfig/error.hpp"
#include "blobfig/io.hpp"
#include "blobfig/path.hpp"
#include "blobfig/value.hpp"
#include "blobfig/view.hpp"
#include "blobfig/writer.hpp"
