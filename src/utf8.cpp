#include "runerip/utf8.h"

namespace runerip {

RUNERIP_ENGINE(, tables::utf8)
RUNERIP_ENGINE(, tables::wtf8)
RUNERIP_ENGINE(, tables::text)

} // namespace runerip
