/*
* str_util.h
*
*/

#ifndef STR_UTIL_H
#define STR_UTIL_H

#include <stddef.h>

// String copy with guaranteed null termination
char *strncpyz(char *dest, size_t dest_size, const char *src, size_t num);
char *strcpyz(char *dest, size_t dest_size, const char *src);

// In-place conversions, return s
char *str_toupper(char *s);
char *str_rtrim(char *s);

template<size_t N>
char *strcpyz(char (&dest)[N], const char *src)
{
	return strcpyz(dest, N, src);
}

#endif // STR_UTIL_H
