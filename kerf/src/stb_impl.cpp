// stb_image_write implementation unit
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>
