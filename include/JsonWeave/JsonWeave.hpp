#pragma once

#include "annotated.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"
#include "enum_meta.hpp"
#include "uuid.hpp"
#include "datetime.hpp"
#include "format_options.hpp"
#include "marshaller.hpp"
#include "unmarshaller.hpp"
#include "json_text.hpp"
#include "error_formatting.hpp"
