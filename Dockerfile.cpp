# Dockerfile for the LMS test fixture generator (C++20)
# Uses CMake and OpenSSL for building

FROM ubuntu:24.04

# Prevent interactive prompts
ENV DEBIAN_FRONTEND=noninteractive

# Install build dependencies
RUN apt-get update && apt-get install -y \
    build-essential \
    cmake \
    libssl-dev \
    && rm -rf /var/lib/apt/lists/*

WORKDIR /app

# Copy source code
COPY CMakeLists.txt ./
COPY src/cpp/ ./src/cpp/
COPY tests/cpp/ ./tests/cpp/

# Create build directory, build and run the tests
RUN mkdir -p build && cd build && \
    cmake .. -DCMAKE_BUILD_TYPE=Release && \
    make -j$(nproc) && \
    ctest --output-on-failure

# Default command prints usage
ENTRYPOINT ["./build/create_lms_tests"]
CMD ["--help"]
