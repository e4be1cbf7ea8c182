#ifndef IMSQ_DECODERS_H
#define IMSQ_DECODERS_H

#include <string>

#include "imsq.h"

namespace GIFImage {

// both throw ImageParseException naming the file

Frame
decodeWithFFmpeg(const std::string& path);

Frame
decodeWithWebP(const std::string& path);

}  // namespace GIFImage

#endif  // IMSQ_DECODERS_H
