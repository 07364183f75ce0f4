#ifndef __CORE_EXT_HPP__
#define __CORE_EXT_HPP__

// Bytes BEGIN
constexpr unsigned long long int operator "" _KiB(const unsigned long long int size) {
	return size * 1024;
}

constexpr unsigned long long int operator "" _MiB(const unsigned long long int size) {
	return size * 1024_KiB;
}
// Bytes END

#endif // ifndef __CORE_EXT_HPP__
