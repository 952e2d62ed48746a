#pragma once

#ifndef NDEBUG
    #include <iostream>
    #define CHUNKSCRIBE_LOG(x) std::cout << x
    #define CHUNKSCRIBE_LOG_ENDL std::endl
#else
    #define CHUNKSCRIBE_LOG(x) ((void)0)
    #define CHUNKSCRIBE_LOG_ENDL ((void)0)
#endif
