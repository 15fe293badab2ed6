#include "str_util.h"

#include <ctype.h>
#include <string.h>

char *strncpyz(char *dest, size_t dest_size, const char *src, size_t num)
{
	size_t n = num >= dest_size ? dest_size - 1 : num;
	strncpy(dest, src, n);
	dest[n] = '\0';

	return dest;
}

char *strcpyz(char *dest, size_t dest_size, const char *src)
{
	return strncpyz(dest, dest_size, src, dest_size - 1);
}

char *str_toupper(char *s)
{
	for (char *p = s; *p; p++) *p = toupper((unsigned char)*p);
	return s;
}

char *str_rtrim(char *s)
{
	int l = strlen(s);
	while (l > 0 && isspace((unsigned char)s[l - 1])) s[--l] = 0;
	return s;
}
