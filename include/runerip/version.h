#ifndef RUNERIP_VERSION_H
#define RUNERIP_VERSION_H

namespace runerip {

const char* version_string();

} // namespace runerip

#endif // RUNERIP_VERSION_H
